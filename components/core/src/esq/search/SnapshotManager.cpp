#include "SnapshotManager.hpp"

#include <string>
#include <utility>

#include <boost/outcome/success_failure.hpp>
#include <spdlog/spdlog.h>

#include "../ErrorCategory.hpp"

namespace esq::search {
SnapshotManager::SnapshotManager(SearchClient& client, std::string keep_alive)
        : m_client{client},
          m_keep_alive{std::move(keep_alive)} {}

SnapshotManager::~SnapshotManager() {
    close();
}

auto SnapshotManager::open() -> Result<void> {
    close();

    auto id = m_client.open_point_in_time(m_keep_alive);
    if (id.has_error()) {
        SPDLOG_ERROR(
                "Failed to open point-in-time on index '{}' - {}",
                m_client.get_index(),
                id.error().message()
        );
        return id.error();
    }
    SPDLOG_DEBUG("Opened point-in-time {}", id.value());
    m_session = SnapshotSession{std::move(id.value()), m_keep_alive};
    return boost::outcome_v2::success();
}

auto SnapshotManager::refresh() -> Result<void> {
    return open();
}

void SnapshotManager::close() {
    if (false == m_session.has_value()) {
        return;
    }

    auto const id = std::move(m_session->id);
    m_session.reset();
    auto const result = m_client.close_point_in_time(id);
    if (result.has_error()) {
        SPDLOG_WARN("Failed to close point-in-time {} - {}", id, result.error().message());
        return;
    }
    SPDLOG_DEBUG("Closed point-in-time {}", id);
}
}  // namespace esq::search
