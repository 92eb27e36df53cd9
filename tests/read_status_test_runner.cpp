#include "read_status.hpp"
#include "test_runner_utils.hpp"

#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using scrollkeeper::test::TestCase;
using scrollkeeper::test::TestContext;
using scrollkeeper::test::make_unit;

// Five chapters, newest first. Server marks 1 and 2 read.
std::vector<ContentUnit> chapter_list() {
  std::vector<ContentUnit> units;
  for(int n = 5; n >= 1; --n) {
    auto unit = make_unit(100 + n, n, 20);
    unit.server_is_read = n <= 2;
    units.push_back(unit);
  }
  return units;
}

ProgressRecord progress_at(const std::string& key, double fraction, int index = 0) {
  ProgressRecord r;
  r.unit_key = key;
  r.position_fraction = fraction;
  r.last_index = index;
  return r;
}

bool test_local_flag_overrides_server(TestContext&) {
  auto units = chapter_list();
  read_status::LocalFlags local = {{"102", false}, {"104", true}};
  auto merged = read_status::merge_read_status(units, local);
  std::vector<bool> expected = {false, true, false, false, true};
  return merged == expected &&
         read_status::is_read(units[4], {}) &&
         !read_status::is_read(units[3], local);
}

bool test_unread_count(TestContext&) {
  auto units = chapter_list();
  return read_status::unread_count(units, {}) == 3 &&
         read_status::unread_count(units, {{"103", true}, {"101", false}}) == 3 &&
         read_status::unread_count(units, {{"103", true}, {"104", true}, {"105", true}}) == 0 &&
         read_status::unread_count({}, {}) == 0;
}

bool test_first_unread_is_oldest(TestContext&) {
  auto units = chapter_list();
  auto next = read_status::first_unread_unit(units, {});
  auto skip_local = read_status::first_unread_unit(units, {{"103", true}});
  auto reopened = read_status::first_unread_unit(units, {{"101", false}});
  return next && next->id == 103 &&
         skip_local && skip_local->id == 104 &&
         reopened && reopened->id == 101;
}

bool test_all_read_falls_back_to_newest(TestContext&) {
  auto units = chapter_list();
  read_status::LocalFlags local = {{"103", true}, {"104", true}, {"105", true}};
  auto next = read_status::first_unread_unit(units, local);
  return next && next->id == 105 &&
         !read_status::first_unread_unit({}, {}).has_value();
}

bool test_has_started_reading(TestContext&) {
  auto units = chapter_list();
  for(auto& u : units) u.server_is_read = false;
  bool fresh = !read_status::has_started_reading(units, {});
  bool local = read_status::has_started_reading(units, {{"101", true}});
  units[4].server_is_read = true;
  bool server = read_status::has_started_reading(units, {});
  bool overridden = !read_status::has_started_reading(units, {{"101", false}});
  return fresh && local && server && overridden;
}

bool test_progress_percent(TestContext&) {
  auto unit = make_unit(103, 3, 20);
  return read_status::progress_percent(progress_at("103", 0.427), unit) == 42 &&
         read_status::progress_percent(progress_at("103", 0.999), unit) == 99 &&
         read_status::progress_percent(progress_at("103", 0.0, 5), unit) == 25 &&
         read_status::progress_percent(progress_at("103", 1.0, 20), unit) == 0 &&
         read_status::progress_percent(progress_at("103", 0.0, kFullyConsumedIndex), unit) == 0 &&
         read_status::progress_percent(progress_at("103", 0.004), unit) == 0;
}

bool test_continue_label(TestContext&) {
  auto units = chapter_list();
  auto next = read_status::first_unread_unit(units, {});
  bool started = read_status::has_started_reading(units, {});

  auto with_progress = read_status::continue_label(next, progress_at("103", 0.5), started);
  auto without_progress = read_status::continue_label(next, std::nullopt, started);
  auto zero_progress = read_status::continue_label(next, progress_at("103", 0.0), started);
  auto not_started = read_status::continue_label(next, std::nullopt, false);
  auto empty_series = read_status::continue_label(std::nullopt, std::nullopt, false);

  auto fractional = make_unit(107, 7.5, 20);
  auto half_chapter = read_status::continue_label(fractional, progress_at("107", 0.2), true);

  return with_progress == "Continue Ch. 3 • 50%" &&
         without_progress == "Continue Ch. 3" &&
         zero_progress == "Continue Ch. 3" &&
         not_started == "Start Reading" &&
         empty_series == "Start Reading" &&
         half_chapter == "Continue Ch. 7 • 20%";
}

bool test_progress_on_fresh_series(TestContext&) {
  auto units = chapter_list();
  for(auto& u : units) u.server_is_read = false;
  auto next = read_status::first_unread_unit(units, {});
  bool started = read_status::has_started_reading(units, {});
  auto label = read_status::continue_label(next, progress_at("101", 0.3), started);
  return next && next->id == 101 && !started && label == "Continue Ch. 1 • 30%";
}

bool test_resume_fraction(TestContext&) {
  auto units = chapter_list();
  auto unread = units[2];  // 20 pages
  unread.server_last_page_read = 10;
  auto past_end = unread;
  past_end.server_last_page_read = 40;
  auto finished = units[4];
  finished.server_last_page_read = 19;

  auto complete = progress_at("103", 1.0, kFullyConsumedIndex);
  complete.is_complete = true;
  auto near = [](double a, double b){ return std::fabs(a - b) < 1e-9; };
  return near(read_status::resume_fraction(unread, std::nullopt, 20), 10.0 / 19.0) &&
         near(read_status::resume_fraction(past_end, std::nullopt, 20), 1.0) &&
         near(read_status::resume_fraction(unread, progress_at("103", 0.3), 20), 0.3) &&
         near(read_status::resume_fraction(unread, complete, 20), 0.0) &&
         near(read_status::resume_fraction(finished, std::nullopt, 20), 0.0) &&
         near(read_status::resume_fraction(units[3], std::nullopt, 20), 0.0) &&
         near(read_status::resume_fraction(unread, std::nullopt, 0), 0.0);
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"local_flag_overrides_server", test_local_flag_overrides_server},
    {"unread_count", test_unread_count},
    {"first_unread_is_oldest", test_first_unread_is_oldest},
    {"all_read_falls_back_to_newest", test_all_read_falls_back_to_newest},
    {"has_started_reading", test_has_started_reading},
    {"progress_percent", test_progress_percent},
    {"continue_label", test_continue_label},
    {"progress_on_fresh_series", test_progress_on_fresh_series},
    {"resume_fraction", test_resume_fraction},
  };
  return scrollkeeper::test::run_test_cases("read_status", tests, argc, argv);
}
