#pragma once
#include <optional>
#include "progress_record.hpp"

// Timestamp ordering for progress writes. The newer record wins; on an exact
// tie the record already stored wins.
namespace conflict {

enum class Outcome { Inserted, Replaced, KeptExisting };

struct Resolution {
  Outcome outcome = Outcome::KeptExisting;
  ProgressRecord winner;
};

bool incoming_wins(const Timestamp& incoming, const ProgressRecord& existing);

Resolution resolve(const std::optional<ProgressRecord>& existing, const ProgressRecord& incoming);

const char* to_string(Outcome outcome);

} // namespace conflict
