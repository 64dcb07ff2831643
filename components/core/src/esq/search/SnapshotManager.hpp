#ifndef ESQ_SEARCH_SNAPSHOTMANAGER_HPP
#define ESQ_SEARCH_SNAPSHOTMANAGER_HPP

#include <optional>
#include <string>

#include "../Defs.hpp"
#include "../ErrorCategory.hpp"
#include "Defs.hpp"
#include "SearchClient.hpp"

namespace esq::search {
/**
 * Owns at most one point-in-time on the service. Whatever is open when the manager is destroyed
 * gets closed.
 */
class SnapshotManager {
public:
    // Constructors
    explicit SnapshotManager(SearchClient& client, std::string keep_alive = cSnapshotKeepAlive);

    // Delete copy constructor and assignment operator
    SnapshotManager(SnapshotManager const&) = delete;
    auto operator=(SnapshotManager const&) -> SnapshotManager& = delete;

    // Delete move constructor and assignment operator
    SnapshotManager(SnapshotManager&&) = delete;
    auto operator=(SnapshotManager&&) -> SnapshotManager& = delete;

    // Destructor
    ~SnapshotManager();

    // Methods
    /**
     * Opens a point-in-time on the client's index. Closes any point-in-time opened earlier first.
     * @return A void result on success, or an error code indicating the failure:
     * - Forwards SearchClient::open_point_in_time's return values on failure.
     */
    [[nodiscard]] auto open() -> Result<void>;

    /**
     * Replaces the current point-in-time with a new one so that documents indexed since the last
     * open become visible.
     * @return Same as `open`
     */
    [[nodiscard]] auto refresh() -> Result<void>;

    /**
     * Closes the current point-in-time, if any. Failures are logged and the local state is
     * cleared regardless.
     */
    void close();

    [[nodiscard]] auto is_open() const -> bool { return m_session.has_value(); }

    [[nodiscard]] auto get_session() const -> std::optional<SnapshotSession> const& {
        return m_session;
    }

private:
    SearchClient& m_client;
    std::string m_keep_alive;
    std::optional<SnapshotSession> m_session;
};
}  // namespace esq::search

#endif  // ESQ_SEARCH_SNAPSHOTMANAGER_HPP
