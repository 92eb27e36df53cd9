#include "remote_sync.hpp"
#include "protocol.hpp"

LoggingRemoteSync::LoggingRemoteSync(std::string server_url, std::shared_ptr<Logger> logger)
  : server_url_(std::move(server_url)), logger_(std::move(logger)) {}

bool LoggingRemoteSync::push_progress(const std::string& unit_key,
                                      int index,
                                      bool is_complete,
                                      std::string& error) {
  if(server_url_.empty()) {
    error = "no server configured";
    return false;
  }
  auto body = make_progress_mutation(unit_key, index, is_complete);
  log_to(logger_.get(), LogChannel::Info, "sync -> {}/api/graphql {}", server_url_, body.dump());
  return true;
}
