#include "core/mailbox.hpp"

namespace asset_agent::core {

const char* to_string(const MailboxStatus status) noexcept {
  switch (status) {
    case MailboxStatus::accepted:
      return "accepted";
    case MailboxStatus::timed_out:
      return "timed out";
    case MailboxStatus::cancelled:
      return "cancelled";
    case MailboxStatus::closed:
      return "closed";
  }
  return "unknown";
}

}  // namespace asset_agent::core
