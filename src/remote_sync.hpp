#pragma once
#include <memory>
#include <string>
#include "log.hpp"

// Best-effort push of one chapter's progress to the content server.
// Returns false and fills error on failure; callers never retry.
class RemoteSync {
public:
  virtual ~RemoteSync() = default;
  virtual bool push_progress(const std::string& unit_key,
                             int index,
                             bool is_complete,
                             std::string& error) = 0;
};

// Logs the mutation body instead of sending it. Stands in for the network
// client when no transport is wired up.
class LoggingRemoteSync : public RemoteSync {
public:
  LoggingRemoteSync(std::string server_url, std::shared_ptr<Logger> logger);

  bool push_progress(const std::string& unit_key,
                     int index,
                     bool is_complete,
                     std::string& error) override;

private:
  std::string server_url_;
  std::shared_ptr<Logger> logger_;
};
