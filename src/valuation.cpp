#include "vestlock/valuation.hpp"

namespace vestlock {

Amount vested_value(const LockRecord& record, Timestamp now) {
  if (record.duration == 0 || now >= record.maturity()) return record.amount;
  if (now <= record.created_at) return 0;

  using Wide = unsigned __int128;
  const Wide elapsed = now - record.created_at;
  const Wide scaled = static_cast<Wide>(record.amount) * elapsed;
  // elapsed < duration here, so the quotient is strictly below amount.
  return static_cast<Amount>(scaled / record.duration);
}

}  // namespace vestlock
