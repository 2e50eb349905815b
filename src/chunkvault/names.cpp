#include "chunkvault/names.h"
#include "utilities/digest.hpp"

namespace chunkvault {

bool isValidIdentifier(std::string_view id) {
  if (id.empty() || id.size() > kMaxIdentifierLength)
    return false;
  return id.find('\0') == std::string_view::npos;
}

bool isValidLabel(std::string_view label) {
  if (label.empty() || label.size() > kMaxLabelLength)
    return false;
  if (label.front() == '.')
    return false;
  for (char c : label) {
    auto uc = static_cast<unsigned char>(c);
    if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7f)
      return false;
  }
  return true;
}

std::string encodeKey(std::string_view id) { return utils::toHex(id); }

std::optional<std::string> decodeKey(std::string_view hex) {
  if (hex.empty())
    return std::nullopt;
  auto raw = utils::fromHex(hex);
  if (!raw)
    return std::nullopt;
  return std::string(raw->begin(), raw->end());
}

std::string workspaceKey(const TenantId &tenant, const std::string &sessionId) {
  return encodeKey(tenant) + "_" + encodeKey(sessionId);
}

std::optional<std::pair<TenantId, std::string>>
parseWorkspaceKey(std::string_view key) {
  auto sep = key.find('_');
  if (sep == std::string_view::npos)
    return std::nullopt;
  auto tenant = decodeKey(key.substr(0, sep));
  auto session = decodeKey(key.substr(sep + 1));
  if (!tenant || !session)
    return std::nullopt;
  return std::make_pair(*tenant, *session);
}

} // namespace chunkvault
