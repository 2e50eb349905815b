#ifndef CHUNKVAULT_NAMES_H
#define CHUNKVAULT_NAMES_H

#include "chunkvault/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chunkvault {

/// Longest path component the filesystem accepts (NAME_MAX).
inline constexpr std::size_t kMaxPathComponent = 255;

/// `<hex(tenant)>_<hex(session)>` must fit one path component.
inline constexpr std::size_t kMaxIdentifierLength = 63;
static_assert(4 * kMaxIdentifierLength + 1 <= kMaxPathComponent);

/// Room for the `.` + `.partial-` + 16 hex digits of a merge temporary.
inline constexpr std::size_t kTemporaryNameOverhead = 26;
inline constexpr std::size_t kMaxLabelLength =
    kMaxPathComponent - kTemporaryNameOverhead;

/// Tenant and session ids: opaque, non-empty, bounded, no NUL bytes.
bool isValidIdentifier(std::string_view id);

/**
 * @brief Category and filename labels used as single path components.
 *
 * Rejects empty names, names starting with '.', path separators, control
 * characters and anything longer than kMaxLabelLength.
 */
bool isValidLabel(std::string_view label);

/// Hex form of an identifier, safe to use as a path component.
std::string encodeKey(std::string_view id);
std::optional<std::string> decodeKey(std::string_view hex);

/// Flat arena key `<hex(tenant)>_<hex(session)>`.
std::string workspaceKey(const TenantId &tenant, const std::string &sessionId);
std::optional<std::pair<TenantId, std::string>>
parseWorkspaceKey(std::string_view key);

} // namespace chunkvault

#endif // CHUNKVAULT_NAMES_H
