#include "conflict_resolver.hpp"

namespace conflict {

bool incoming_wins(const Timestamp& incoming, const ProgressRecord& existing) {
  return incoming > existing.updated_at;
}

Resolution resolve(const std::optional<ProgressRecord>& existing, const ProgressRecord& incoming) {
  Resolution r;
  if(!existing) {
    r.outcome = Outcome::Inserted;
    r.winner = incoming;
    return r;
  }
  if(incoming_wins(incoming.updated_at, *existing)) {
    r.outcome = Outcome::Replaced;
    r.winner = incoming;
    // a partial writer (legacy import) may not know the series
    if(r.winner.series_key.empty()) r.winner.series_key = existing->series_key;
    return r;
  }
  r.outcome = Outcome::KeptExisting;
  r.winner = *existing;
  return r;
}

const char* to_string(Outcome outcome) {
  switch(outcome) {
    case Outcome::Inserted:     return "inserted";
    case Outcome::Replaced:     return "replaced";
    case Outcome::KeptExisting: return "kept-existing";
  }
  return "?";
}

} // namespace conflict
