#pragma once
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <readline/history.h>
#include <readline/readline.h>

#include "content_source.hpp"
#include "progress_importer.hpp"
#include "read_status.hpp"
#include "reader_engine.hpp"
#include "reader_layout.hpp"
#include "reader_session.hpp"
#include "settings_manager.hpp"

// Interactive driver standing in for the reader screen. Every command is
// also reachable through ReaderEngine::execute_command.
class ReaderCLI {
public:
  explicit ReaderCLI(ReaderEngine& engine)
    : engine_(engine), logger_(engine.logger()), running_(true) {}

  ~ReaderCLI() {
    stop();
  }

  void start() {
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  void stop() {
    running_ = false;
    if(cli_thread_.joinable() && cli_thread_.get_id() != std::this_thread::get_id()) {
      cli_thread_.join();
    }
  }

  void execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return;
    std::string args;
    std::getline(iss, args);
    args = SettingsManager::trim_copy(args);

    try {
      dispatch(cmd, args);
    } catch(const std::exception& e) {
      logger_->print_err("{}: {}", cmd, e.what());
    }
  }

private:
  void run_loop() {
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) break;
      if(input->empty()) continue;
      execute_command(*input);
    }
  }

  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
  }

  void dispatch(const std::string& cmd, const std::string& args) {
    if(cmd == "open" || cmd == "o") {
      open_command(args);
    } else if(cmd == "chapters" || cmd == "ls") {
      list_chapters();
    } else if(cmd == "scroll") {
      scroll_command(args);
    } else if(cmd == "settle") {
      if(auto session = require_session()) {
        session->on_settle();
        print_status();
      }
    } else if(cmd == "next" || cmd == "n") {
      jump_section(+1);
    } else if(cmd == "prev" || cmd == "p") {
      jump_section(-1);
    } else if(cmd == "window" || cmd == "w") {
      print_window();
    } else if(cmd == "heights") {
      heights_command(args);
    } else if(cmd == "progress") {
      progress_command(args);
    } else if(cmd == "status") {
      print_status();
    } else if(cmd == "complete") {
      complete_command(args);
    } else if(cmd == "markread") {
      mark_command(args, true);
    } else if(cmd == "markunread") {
      mark_command(args, false);
    } else if(cmd == "import") {
      import_command(args);
    } else if(cmd == "clear") {
      auto erased = engine_.progress()->clear_history();
      logger_->print("Cleared {} progress records", erased);
    } else if(cmd == "close") {
      engine_.close_reader();
      logger_->print("Reader closed");
    } else if(cmd == "settings" || cmd == "s") {
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "get") {
      handle_settings_command(args.empty() ? "list" : "get " + args);
    } else if(cmd == "save") {
      handle_settings_command("save");
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "q") {
      logger_->print("Quitting...");
      running_ = false;
      engine_.request_stop();
    } else {
      print_help();
      logger_->print("Unknown command: {}", cmd);
    }
  }

  std::shared_ptr<ReaderSession> require_session() {
    auto session = engine_.current_session();
    if(!session) logger_->print("No chapter open. Use: open <chapter-id>");
    return session;
  }

  static std::optional<int64_t> parse_id(const std::string& token) {
    try {
      std::size_t used = 0;
      auto value = std::stoll(token, &used);
      if(used != token.size()) return std::nullopt;
      return value;
    } catch(const std::exception&) {
      return std::nullopt;
    }
  }

  static std::vector<std::string> split_words(const std::string& args) {
    std::istringstream iss(args);
    std::vector<std::string> out;
    std::string word;
    while(iss >> word) out.push_back(word);
    return out;
  }

  read_status::LocalFlags local_flags(const std::vector<ContentUnit>& units) {
    std::vector<std::string> keys;
    keys.reserve(units.size());
    for(const auto& u : units) keys.push_back(u.key());
    return engine_.progress()->get_read_status(keys);
  }

  void open_command(const std::string& args) {
    auto words = split_words(args);
    auto catalog = engine_.catalog();
    auto units = catalog->units();
    std::optional<ContentUnit> unit;
    if(words.empty()) {
      unit = read_status::first_unread_unit(units, local_flags(units));
    } else if(auto id = parse_id(words[0])) {
      unit = catalog->unit(*id);
    }
    if(!unit) {
      logger_->print("Unknown chapter {}", words.empty() ? std::string("(catalog empty)") : words[0]);
      return;
    }

    auto items = catalog->fetch_items(unit->id);
    double resume = 0.0;
    if(words.size() > 1) {
      resume = std::stod(words[1]) / 100.0;
    } else {
      resume = read_status::resume_fraction(*unit, engine_.progress()->get_progress(unit->key()),
                                            static_cast<int>(items.size()));
    }

    auto session = engine_.open_reader();
    session->open(*unit, std::move(items), resume);
    print_status();
  }

  void list_chapters() {
    auto units = engine_.catalog()->units();
    if(units.empty()) {
      logger_->print("Catalog is empty (set catalog_path)");
      return;
    }
    auto flags = local_flags(units);
    auto merged = read_status::merge_read_status(units, flags);
    for(std::size_t i = 0; i < units.size(); ++i) {
      logger_->print("  {} {:>8}  Ch. {:<6} {} ({} pages)",
                     merged[i] ? "x" : " ",
                     units[i].id,
                     units[i].chapter_number,
                     units[i].display_name,
                     units[i].page_count);
    }
    auto first_unread = read_status::first_unread_unit(units, flags);
    std::optional<ProgressRecord> progress;
    if(first_unread) progress = engine_.progress()->get_progress(first_unread->key());
    logger_->print("{} unread. [{}]",
                   read_status::unread_count(units, flags),
                   read_status::continue_label(first_unread, progress,
                                               read_status::has_started_reading(units, flags)));
  }

  void scroll_command(const std::string& args) {
    auto session = require_session();
    if(!session || args.empty()) return;
    float target = 0.0f;
    if(args[0] == '+' || args[0] == '-') {
      target = session->offset() + std::stof(args);
    } else {
      target = std::stof(args);
    }
    session->on_scroll(target);
    logger_->print("offset {:.0f}", std::max(0.0f, target));
  }

  void jump_section(int delta) {
    auto session = require_session();
    if(!session) return;
    auto sections = session->window()->snapshot();
    auto status = session->status();
    const auto current = static_cast<long>(status.active_section);
    const long target = current + delta;
    if(target < 0 || target >= static_cast<long>(sections.size())) {
      logger_->print("No {} chapter loaded yet", delta > 0 ? "next" : "previous");
      return;
    }
    const auto m = session->metrics();
    const float start = layout::section_start(sections, static_cast<std::size_t>(target), m);
    session->on_scroll(start);
    session->on_settle();
    print_status();
  }

  void print_window() {
    auto session = require_session();
    if(!session) return;
    auto window = session->window();
    const auto active = window->active_index();
    auto sections = window->snapshot();
    const auto m = session->metrics();
    for(std::size_t i = 0; i < sections.size(); ++i) {
      const auto& s = sections[i];
      logger_->print("{} [{}] {:>8} {:<10} {:>3} pages {:>3} heights {:>8.0f}px  {}",
                     i == active ? "*" : " ",
                     i,
                     s.unit.id,
                     to_string(s.load_state),
                     s.items.size(),
                     s.sub_item_heights.size(),
                     layout::section_height(s, m),
                     s.unit.display_name);
    }
    auto prefetcher = session->prefetcher();
    for(auto direction : {Direction::Backward, Direction::Forward}) {
      std::string state = prefetcher->in_flight(direction) ? "fetching"
                        : prefetcher->reached_end(direction) ? "end reached"
                        : "idle";
      if(auto failure = prefetcher->last_failure(direction)) state = "failed: " + *failure;
      logger_->print("  {} edge: {}", to_string(direction), state);
    }
  }

  void heights_command(const std::string& args) {
    auto session = require_session();
    if(!session) return;
    auto words = split_words(args);
    if(words.size() != 4) {
      logger_->print("Usage: heights <section> <page> <image-width> <image-height>");
      return;
    }
    const auto section = static_cast<std::size_t>(std::stoul(words[0]));
    const int page = std::stoi(words[1]);
    const bool stored = session->report_page_size(section, page, std::stoi(words[2]), std::stoi(words[3]));
    if(stored) {
      logger_->print("Cached height for section {} page {}: {:.1f}px", section, page,
                     session->window()->cached_page_height(page, section).value_or(0.0f));
    } else {
      logger_->print("Height not stored (already cached or invalid)");
    }
  }

  void progress_command(const std::string& args) {
    std::string key = args;
    if(key.empty()) {
      if(auto session = engine_.current_session()) key = session->status().active_unit_key;
    }
    if(key.empty()) {
      logger_->print("Usage: progress <chapter-id>");
      return;
    }
    auto record = engine_.progress()->get_progress(key);
    if(!record) {
      logger_->print("No progress stored for chapter {}", key);
      return;
    }
    logger_->print("chapter {} series {}: {:.1f}% page {} {}",
                   record->unit_key,
                   record->series_key.empty() ? "-" : record->series_key,
                   record->position_fraction * 100.0,
                   record->last_index == kFullyConsumedIndex ? std::string("end") : std::to_string(record->last_index),
                   record->is_complete ? "(complete)" : "");
  }

  void print_status() {
    if(auto session = engine_.current_session()) {
      auto st = session->status();
      logger_->print("chapter {} section {} page {} | chapter {:.1f}% | strip {:.1f}% | offset {:.0f}/{:.0f}",
                     st.active_unit_key,
                     st.active_section,
                     st.active_item < 0 ? std::string("header") : std::to_string(st.active_item + 1),
                     st.section_fraction * 100.0,
                     st.overall_fraction * 100.0,
                     st.offset,
                     st.content_height);
    }
    auto stats = engine_.stats();
    logger_->print("sections {} loaded {} | images {} ({} bytes) | writes {} stale {} failed {} | sync ok {} failed {}",
                   stats.sections,
                   stats.loaded_sections,
                   stats.cached_images,
                   stats.cached_image_bytes,
                   stats.progress.durable_writes,
                   stats.progress.stale_ignored,
                   stats.progress.write_failures,
                   stats.progress.remote_pushes,
                   stats.progress.remote_failures);
  }

  void complete_command(const std::string& args) {
    std::string key = args;
    std::string series;
    if(auto session = engine_.current_session()) {
      auto st = session->status();
      if(key.empty()) key = st.active_unit_key;
    }
    if(key.empty()) {
      logger_->print("Usage: complete <chapter-id>");
      return;
    }
    if(auto id = parse_id(key)) {
      if(auto unit = engine_.catalog()->unit(*id)) series = unit->series_id;
    }
    engine_.progress()->mark_unit_complete_immediate(key, series);
    logger_->print("Chapter {} marked complete", key);
  }

  void mark_command(const std::string& args, bool is_read) {
    auto catalog = engine_.catalog();
    std::vector<std::string> keys;
    std::string series;
    if(args == "all") {
      for(const auto& u : catalog->units()) {
        keys.push_back(u.key());
        if(series.empty()) series = u.series_id;
      }
    } else {
      keys = split_words(args);
      if(!keys.empty()) {
        if(auto id = parse_id(keys.front())) {
          if(auto unit = catalog->unit(*id)) series = unit->series_id;
        }
      }
    }
    if(keys.empty()) {
      logger_->print("Usage: {} <chapter-id...>|all", is_read ? "markread" : "markunread");
      return;
    }
    auto queued = engine_.progress()->mark_units_read(keys, series, is_read);
    logger_->print("Marked {} chapters {}", queued, is_read ? "read" : "unread");
  }

  void import_command(const std::string& args) {
    if(args.empty()) {
      logger_->print("Usage: import <legacy-progress.json>");
      return;
    }
    ProgressImporter importer(engine_.progress(), logger_);
    auto report = importer.import_file(args);
    engine_.progress()->drain();
    logger_->print("Imported {} records ({} skipped, {} rejected)",
                   report.imported(), report.skipped, report.rejected);
  }

  void handle_settings_command(const std::string& args) {
    auto settings = engine_.settings();
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      for(const auto& key : settings->keys()) {
        logger_->print("  {:<28} {:<24} {}", key, settings->value_as_string(key), settings->description(key));
      }
      return;
    }
    if(action == "get") {
      std::string key;
      iss >> key;
      auto resolved = settings->resolve_key(key);
      if(!resolved) {
        logger_->print("Unknown setting: {}", key);
        return;
      }
      logger_->print("{} = {}", *resolved, settings->value_as_string(*resolved));
      return;
    }
    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      value = SettingsManager::trim_copy(value);
      auto resolved = settings->resolve_key(key);
      if(!resolved) {
        logger_->print("Unknown setting: {}", key);
        return;
      }
      if(value.empty() && settings->is_bool_setting(*resolved)) value = "true";
      std::string error;
      if(!settings->set_from_string(*resolved, value, error)) {
        logger_->print("Failed to set {}: {}", *resolved, error);
        return;
      }
      logger_->print("{} = {} (applies to the next opened chapter)", *resolved, settings->value_as_string(*resolved));
      return;
    }
    if(action == "save") {
      if(settings->save()) {
        logger_->print("Settings saved to {}", settings->settings_path().string());
      } else {
        logger_->print("Failed to save settings to {}", settings->settings_path().string());
      }
      return;
    }
    logger_->print("Usage: settings [list|get <key>|set <key> <value>|save]");
  }

  void print_help() {
    logger_->print("Available commands:");
    logger_->print("  help|h|?                          Show this help message");
    logger_->print("  quit|q                            Exit the application");
    logger_->print("  chapters|ls                       List chapters with read state");
    logger_->print("  open|o [chapter-id [percent]]     Open a chapter (default: continue reading)");
    logger_->print("  close                             Close the reader and flush progress");
    logger_->print("  scroll <offset>|+d|-d             Scroll to an offset or by a delta");
    logger_->print("  settle                            End the scroll gesture");
    logger_->print("  next|n / prev|p                   Jump to the next or previous loaded chapter");
    logger_->print("  window|w                          Show window sections and fetch state");
    logger_->print("  heights <sec> <page> <w> <h>      Report a decoded page size");
    logger_->print("  progress [chapter-id]             Show stored progress");
    logger_->print("  status                            Show position and counters");
    logger_->print("  complete [chapter-id]             Mark a chapter complete now");
    logger_->print("  markread <ids...>|all             Mark chapters read");
    logger_->print("  markunread <ids...>|all           Mark chapters unread");
    logger_->print("  import <file>                     Import legacy progress");
    logger_->print("  clear                             Delete all reading history");
    logger_->print("  settings [list|get|set|save]      Manage runtime settings");
    logger_->print("  set [key value]                   Shortcut for settings set (lists when empty)");
    logger_->print("  get <key>                         Shortcut for settings get");
    logger_->print("  save                              Shortcut for settings save");
  }

  ReaderEngine& engine_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> running_;
  std::thread cli_thread_;
};
