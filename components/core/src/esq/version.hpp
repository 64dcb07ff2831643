#ifndef ESQ_VERSION_HPP
#define ESQ_VERSION_HPP

namespace esq {
constexpr char cVersion[] = "0.1.0";
}  // namespace esq

#endif  // ESQ_VERSION_HPP
