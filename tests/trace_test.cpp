#include "trace_test.hpp"

#include <cppunit/TestAssert.h>
#include <cppunit/TestCaller.h>
#include <cppunit/TestSuite.h>

#include <sstream>
#include <string>
#include <vector>

#include "mlfq_sim/scheduler.hpp"

using namespace mlfq_sim;

void TraceTest::test_event_names() {
  CPPUNIT_ASSERT_EQUAL(std::string("exec"), std::string(event_name(TraceKind::Exec)));
  CPPUNIT_ASSERT_EQUAL(std::string("demote"), std::string(event_name(TraceKind::Demote)));
  CPPUNIT_ASSERT_EQUAL(std::string("finish"), std::string(event_name(TraceKind::Finish)));
  CPPUNIT_ASSERT_EQUAL(std::string("drop"), std::string(event_name(TraceKind::Drop)));
  CPPUNIT_ASSERT_EQUAL(std::string("requeue"), std::string(event_name(TraceKind::Requeue)));
  CPPUNIT_ASSERT_EQUAL(std::string("boost"), std::string(event_name(TraceKind::Boost)));
}

void TraceTest::test_format_exec() {
  TraceEvent ev;
  ev.pid = 1;
  ev.executed = 2;
  ev.remaining = 8;
  CPPUNIT_ASSERT_EQUAL(std::string("Executed Process ID: 1, Time Executed: 2, Time Remaining: 8"),
                       format_exec(ev));
}

void TraceTest::test_logger_writes_csv() {
  std::ostringstream out;
  Logger log(out);
  Scheduler s(3, {2, 4, 8});
  s.set_trace(log.sink());
  s.add_process({1, 0, 5, 0});

  s.execute_process(0);
  s.update_time(98);

  CPPUNIT_ASSERT(log.is_open());
  CPPUNIT_ASSERT_EQUAL(std::size_t(3), log.rows());
  CPPUNIT_ASSERT_EQUAL(std::string("time,event,pid,info\n"
                                   "2,exec,1,tier=0 ran=2 left=3\n"
                                   "2,demote,1,to=1\n"
                                   "100,boost,-1,moved=1\n"),
                       out.str());
}

void TraceTest::test_logger_unopened_discards() {
  Logger log("/nonexistent-dir/mlfq/trace.csv");
  CPPUNIT_ASSERT(!log.is_open());
  log.log(0, "exec", 1, "ignored");
  CPPUNIT_ASSERT_EQUAL(std::size_t(0), log.rows());
}

void TraceTest::test_process_format() {
  std::ostringstream out;
  out << Process{1, 0, 10, 0};
  CPPUNIT_ASSERT_EQUAL(
    std::string("Process { id: 1, priority: 0, remaining_time: 10, total_executed_time: 0 }"),
    out.str());
}

void TraceTest::test_dump_tiers() {
  Scheduler s(2, {3, 6});
  s.add_process({7, 0, 5, 1});
  s.add_process({8, 1, 2, 0});
  s.add_process({9, 1, 4, 2});

  std::ostringstream out;
  dump_tiers(out, s);

  CPPUNIT_ASSERT_EQUAL(
    std::string("Queue 0: [Process { id: 7, priority: 0, remaining_time: 5, total_executed_time: 1 }]\n"
                "Queue 1: [Process { id: 8, priority: 1, remaining_time: 2, total_executed_time: 0 }, "
                "Process { id: 9, priority: 1, remaining_time: 4, total_executed_time: 2 }]\n"),
    out.str());
}

void TraceTest::test_reference_scenario_trace() {
  Scheduler s(3, {2, 4, 8});
  std::vector<std::string> lines;
  s.set_trace([&](const TraceEvent& e) { if (e.kind == TraceKind::Exec) lines.push_back(format_exec(e)); });
  s.add_process({1, 0, 10, 0});
  s.add_process({2, 0, 3, 0});
  s.add_process({3, 1, 5, 0});

  for (std::size_t lvl = 0; lvl < s.num_levels(); ++lvl)
    while (!s.tier(lvl).empty()) s.execute_process(lvl);
  s.update_time(100);

  std::vector<std::string> expected = {
    "Executed Process ID: 2, Time Executed: 2, Time Remaining: 1",
    "Executed Process ID: 1, Time Executed: 2, Time Remaining: 8",
    "Executed Process ID: 1, Time Executed: 4, Time Remaining: 4",
    "Executed Process ID: 2, Time Executed: 1, Time Remaining: 0",
    "Executed Process ID: 3, Time Executed: 4, Time Remaining: 1",
    "Executed Process ID: 3, Time Executed: 1, Time Remaining: 0",
    "Executed Process ID: 1, Time Executed: 4, Time Remaining: 0",
  };
  CPPUNIT_ASSERT(lines == expected);
  CPPUNIT_ASSERT_EQUAL(std::uint32_t(118), s.current_time());

  std::ostringstream out;
  dump_tiers(out, s);
  CPPUNIT_ASSERT_EQUAL(std::string("Queue 0: []\nQueue 1: []\nQueue 2: []\n"), out.str());
}

CppUnit::Test* TraceTest::Suite() {
  CppUnit::TestSuite* suite = new CppUnit::TestSuite("TraceTest");
  suite->addTest(new CppUnit::TestCaller<TraceTest>(
    "TraceTest::test_event_names", &TraceTest::test_event_names));
  suite->addTest(new CppUnit::TestCaller<TraceTest>(
    "TraceTest::test_format_exec", &TraceTest::test_format_exec));
  suite->addTest(new CppUnit::TestCaller<TraceTest>(
    "TraceTest::test_logger_writes_csv", &TraceTest::test_logger_writes_csv));
  suite->addTest(new CppUnit::TestCaller<TraceTest>(
    "TraceTest::test_logger_unopened_discards", &TraceTest::test_logger_unopened_discards));
  suite->addTest(new CppUnit::TestCaller<TraceTest>(
    "TraceTest::test_process_format", &TraceTest::test_process_format));
  suite->addTest(new CppUnit::TestCaller<TraceTest>(
    "TraceTest::test_dump_tiers", &TraceTest::test_dump_tiers));
  suite->addTest(new CppUnit::TestCaller<TraceTest>(
    "TraceTest::test_reference_scenario_trace", &TraceTest::test_reference_scenario_trace));
  return suite;
}
