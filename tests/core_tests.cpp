// Core unit tests without external framework (run via CTest).
#include "fileops/BatchPolicy.hpp"
#include "fileops/MockFileSystem.hpp"
#include "fileops/OperationTask.hpp"
#include "fileops/Policy.hpp"
#include "fileops/Pump.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using fileops::Command;
using fileops::Decision;
using fileops::DecisionKind;
using fileops::DecisionTag;
using fileops::MockFileSystem;
using fileops::OperationKind;
using fileops::SuspensionKind;
using fileops::TaskState;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

// Answers from fields and records every call as one log line.
struct RecordingPolicy : fileops::Policy {
    Decision overwrite{DecisionTag::Overwrite};
    Decision ioError{DecisionTag::Skip};
    Decision partial{DecisionTag::Delete};
    Decision nonEmpty{DecisionTag::Delete};

    std::vector<std::string> log;
    std::vector<std::string> ioMessages;
    fileops::PolicyState st;

    Decision decideOnOverwrite(const fileops::Entry &src,
                               const fileops::Entry &dst) override {
        log.push_back("overwrite " + src.name + " " + dst.name);
        return overwrite;
    }
    Decision decideOnIoError(const std::string &message) override {
        log.push_back("io_error");
        ioMessages.push_back(message);
        return ioError;
    }
    Decision decideOnPartial(const fileops::Entry &src, const fileops::Entry &) override {
        log.push_back("partial " + src.name);
        return partial;
    }
    Decision decideOnNonEmptyDirDeletion(const fileops::Entry &src) override {
        log.push_back("non_empty " + src.name);
        return nonEmpty;
    }
    void notifyOnOperationStart(OperationKind op, const fileops::Entry &src,
                                const fileops::Entry *dst) override {
        std::string line = std::string("start ") + fileops::toWire(op) + " " + src.name;
        if (dst)
            line += " -> " + dst->name;
        log.push_back(line);
    }
    void notifyOnProgress(std::uint64_t part, std::uint64_t whole) override {
        log.push_back("progress " + std::to_string(part) + "/" + std::to_string(whole));
    }
    void start(fileops::OperationTask &task) override {
        fileops::Pump pump(task, *this);
        while (pump.step()) {
        }
    }
    fileops::PolicyState &state() override { return st; }
    const fileops::PolicyState &state() const override { return st; }

    int count(const std::string &prefix) const {
        int n = 0;
        for (const auto &l : log) {
            if (l.compare(0, prefix.size(), prefix) == 0)
                ++n;
        }
        return n;
    }
    int decisions() const {
        return count("overwrite") + count("io_error") + count("partial") +
               count("non_empty");
    }
};

// Replays a fixed list of suspensions and records the commands it receives.
class ScriptedTask : public fileops::OperationTask {
public:
    explicit ScriptedTask(std::vector<fileops::Suspension> script)
        : script_(std::move(script)) {}

    fileops::Suspension resume(const Command &command) override {
        commands.push_back(command);
        fileops::Suspension s = script_.at(next_++);
        if (s.kind == SuspensionKind::Terminated)
            state_ = TaskState::Terminated;
        else if (s.kind == SuspensionKind::Dead)
            state_ = TaskState::Dead;
        else
            state_ = TaskState::Suspended;
        return s;
    }
    TaskState state() const override { return state_; }
    OperationKind kind() const override { return OperationKind::Copy; }

    std::vector<Command> commands;

private:
    std::vector<fileops::Suspension> script_;
    std::size_t next_ = 0;
    TaskState state_ = TaskState::Suspended;
};

fileops::Suspension susp(SuspensionKind kind, std::uint64_t part = 0,
                         std::uint64_t whole = 0) {
    fileops::Suspension s;
    s.kind = kind;
    s.part = part;
    s.whole = whole;
    s.src.name = "/s";
    fileops::Entry dst;
    dst.name = "/d";
    s.dst = dst;
    return s;
}

std::unique_ptr<fileops::OperationTask>
makeTask(MockFileSystem &fs, OperationKind kind,
         std::vector<fileops::Transfer> transfers,
         std::size_t chunk = 1024 * 1024, bool preserve = true) {
    fileops::TaskOptions o;
    o.chunkSize = chunk;
    o.preserve = preserve;
    return fileops::createTask(fs, kind, std::move(transfers), o);
}

TaskState run(fileops::OperationTask &task, RecordingPolicy &p) {
    p.start(task);
    return task.state();
}

// Forwards to a real task and notes any resume after a terminal result.
class WatchedTask : public fileops::OperationTask {
public:
    explicit WatchedTask(fileops::OperationTask &inner) : inner_(inner) {}

    fileops::Suspension resume(const Command &command) override {
        if (inner_.finished())
            ++resumesAfterEnd;
        return inner_.resume(command);
    }
    TaskState state() const override { return inner_.state(); }
    OperationKind kind() const override { return inner_.kind(); }

    int resumesAfterEnd = 0;

private:
    fileops::OperationTask &inner_;
};

// Drives a task with "p" until the pump stops; returns the outcome.
TaskState runWatched(fileops::OperationTask &task, RecordingPolicy &p, int &lateResumes) {
    WatchedTask watched(task);
    fileops::Pump pump(watched, p);
    while (pump.step()) {
    }
    lateResumes = watched.resumesAfterEnd;
    return pump.outcome();
}

void test_wire_names(TestContext &t) {
    t.check(std::string(fileops::toWire(DecisionTag::Overwrite)) == "overwrite",
            "overwrite wire name");
    t.check(std::string(fileops::toWire(DecisionTag::Reget)) == "reget",
            "reget wire name");
    t.check(std::string(fileops::toWire(DecisionTag::Keep)) == "keep", "keep wire name");
    t.check(fileops::decisionTagFromWire("update") == DecisionTag::Update,
            "update should parse");
    t.check(!fileops::decisionTagFromWire("Overwrite").has_value(),
            "wire names are case sensitive");
    t.check(fileops::operationKindFromWire("move") == OperationKind::Move,
            "move should parse");
    t.check(!fileops::operationKindFromWire("rename").has_value(),
            "unknown operation should not parse");
    t.check(std::string(fileops::toWire(DecisionKind::NonEmptyDirDeletion)) ==
                "non_empty_dir_deletion",
            "non-empty dir decision wire name");
    t.check(fileops::describe(Decision(DecisionTag::Skip, true)) == "skip (all)",
            "describe should mark blanket answers");
}

void test_legal_answers(TestContext &t) {
    using fileops::isLegal;
    t.check(isLegal(DecisionKind::Overwrite, DecisionTag::Reget),
            "reget is legal for overwrite");
    t.check(!isLegal(DecisionKind::Overwrite, DecisionTag::Delete),
            "delete is not legal for overwrite");
    t.check(isLegal(DecisionKind::IoError, DecisionTag::Skip), "skip legal for io_error");
    t.check(!isLegal(DecisionKind::IoError, DecisionTag::Overwrite),
            "overwrite not legal for io_error");
    t.check(isLegal(DecisionKind::Partial, DecisionTag::Keep), "keep legal for partial");
    t.check(!isLegal(DecisionKind::Partial, DecisionTag::Abort),
            "abort not legal for partial");
    t.check(isLegal(DecisionKind::NonEmptyDirDeletion, DecisionTag::Delete),
            "delete legal for non-empty dir");
    t.check(!isLegal(DecisionKind::NonEmptyDirDeletion, DecisionTag::Keep),
            "keep not legal for non-empty dir");
}

void test_progress_percent(TestContext &t) {
    t.check(std::fabs(fileops::progressPercent(50, 200) - 25.0) < 1e-9,
            "50 of 200 should be 25 percent");
    t.check(fileops::progressPercent(300, 200) == 100.0, "percent is capped at 100");
    bool threw = false;
    try {
        (void)fileops::progressPercent(1, 0);
    } catch (const fileops::ContractError &) {
        threw = true;
    }
    t.check(threw, "whole == 0 should be a contract error");
}

void test_policy_state_memo(TestContext &t) {
    fileops::PolicyState st;
    st.remember(DecisionKind::Overwrite, Decision(DecisionTag::Skip));
    t.check(!st.recall(DecisionKind::Overwrite).has_value(),
            "single answers should not be remembered");
    st.remember(DecisionKind::Overwrite, Decision(DecisionTag::Update, true));
    const auto d = st.recall(DecisionKind::Overwrite);
    t.check(d && d->tag == DecisionTag::Update, "blanket answer should be remembered");
    t.check(!st.recall(DecisionKind::IoError).has_value(),
            "memo is per decision kind");
}

void test_batch_answers_constant(TestContext &t) {
    std::ostringstream out;
    fileops::BatchPolicy p(out);
    fileops::Entry a;
    a.name = "/a";
    fileops::Entry b;
    b.name = "/b";
    b.exists = true;
    for (int i = 0; i < 2; ++i) {
        t.check(p.decideOnOverwrite(a, b).tag == DecisionTag::Overwrite,
                "batch overwrite answer");
        t.check(p.decideOnIoError("boom").tag == DecisionTag::Skip, "batch io answer");
        t.check(p.decideOnPartial(a, b).tag == DecisionTag::Delete, "batch partial answer");
        t.check(p.decideOnNonEmptyDirDeletion(a).tag == DecisionTag::Delete,
                "batch non-empty dir answer");
    }
    t.check(p.state().forAll.empty(), "batch should not touch the memo");

    p.notifyOnOperationStart(OperationKind::Copy, a, &b);
    p.notifyOnOperationStart(OperationKind::Delete, a, nullptr);
    p.notifyOnProgress(1, 2);
    t.check(out.str() == "/a -> /b\nrm /a\n", "batch notification lines");
}

void test_pump_routes_in_order(TestContext &t) {
    ScriptedTask task({susp(SuspensionKind::Starting),
                       susp(SuspensionKind::NeedOverwriteDecision),
                       susp(SuspensionKind::Progress, 50, 200),
                       susp(SuspensionKind::NeedIoErrorDecision),
                       susp(SuspensionKind::Dead)});
    RecordingPolicy p;
    p.overwrite = Decision(DecisionTag::Reget);
    fileops::Pump pump(task, p);
    int steps = 0;
    while (pump.step())
        ++steps;

    t.check(steps == 4, "pump should return true for every non-terminal step");
    t.check(p.log.size() == 4, "one policy call per non-terminal suspension");
    if (p.log.size() == 4) {
        t.check(p.log[0] == "start copy /s -> /d", "starting routed first");
        t.check(p.log[1] == "overwrite /s /d", "overwrite decision second");
        t.check(p.log[2] == "progress 50/200", "progress third");
        t.check(p.log[3] == "io_error", "io error fourth");
    }
    const std::vector<Command> expected = {std::nullopt, std::nullopt, DecisionTag::Reget,
                                           std::nullopt, DecisionTag::Skip};
    t.check(task.commands == expected, "answers reach the next resume");
    t.check(pump.outcome() == TaskState::Dead, "outcome should be dead");

    bool threw = false;
    try {
        pump.step();
    } catch (const fileops::ContractError &) {
        threw = true;
    }
    t.check(threw, "stepping a finished pump is a contract error");
}

void test_pump_abort_and_skip_requests(TestContext &t) {
    {
        ScriptedTask task({susp(SuspensionKind::Starting),
                           susp(SuspensionKind::NeedPartialDecision),
                           susp(SuspensionKind::Terminated)});
        RecordingPolicy p;
        p.partial = Decision(DecisionTag::Keep);
        fileops::Pump pump(task, p);
        pump.step();
        pump.requestAbort();
        pump.step();
        t.check(task.commands.back() == Command(DecisionTag::Abort),
                "abort should follow a notification");
        pump.requestAbort();
        const bool more = pump.step();
        t.check(task.commands.back() == Command(DecisionTag::Keep),
                "partial answer should be delivered before another abort");
        t.check(!more && pump.outcome() == TaskState::Terminated,
                "scripted task should end terminated");
    }
    {
        ScriptedTask task({susp(SuspensionKind::Starting),
                           susp(SuspensionKind::NeedOverwriteDecision),
                           susp(SuspensionKind::Progress, 1, 2),
                           susp(SuspensionKind::Dead)});
        RecordingPolicy p;
        fileops::Pump pump(task, p);
        pump.step();
        pump.step();
        pump.requestSkip();
        pump.step();
        t.check(task.commands.back() == Command(DecisionTag::Overwrite),
                "skip should not replace a decision answer");
        pump.requestSkip();
        pump.step();
        t.check(task.commands.back() == Command(DecisionTag::Skip),
                "skip should follow a notification");
    }
}

void test_pump_rejects_illegal_answer(TestContext &t) {
    ScriptedTask task({susp(SuspensionKind::NeedOverwriteDecision), susp(SuspensionKind::Dead)});
    RecordingPolicy p;
    p.overwrite = Decision(DecisionTag::Delete);
    fileops::Pump pump(task, p);
    bool fault = false;
    bool nested = false;
    try {
        pump.step();
    } catch (const fileops::OperationFault &e) {
        fault = true;
        t.checkContains(e.what(), "policy answered 'delete'", "fault should name the answer");
        t.checkContains(e.what(), "step 1", "fault should carry the step number");
        try {
            std::rethrow_if_nested(e);
        } catch (const fileops::ContractError &) {
            nested = true;
        }
    }
    t.check(fault, "illegal answer should fault the pump");
    t.check(nested, "contract error should be nested in the fault");
    t.check(pump.finished(), "pump should be finished after a fault");
}

void test_pump_rejects_zero_whole(TestContext &t) {
    ScriptedTask task({susp(SuspensionKind::Progress, 0, 0), susp(SuspensionKind::Dead)});
    RecordingPolicy p;
    fileops::Pump pump(task, p);
    bool fault = false;
    try {
        pump.step();
    } catch (const fileops::OperationFault &) {
        fault = true;
    }
    t.check(fault, "progress with whole == 0 should fault");
}

void test_batch_copy_single_file(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a.txt", "hello");
    auto task = makeTask(fs, OperationKind::Copy, {{"/a.txt", "/b.txt"}});
    RecordingPolicy p;
    t.check(run(*task, p) == TaskState::Dead, "copy should end dead");
    t.check(p.decisions() == 0, "fresh copy needs no decision");
    t.check(p.count("start copy /a.txt -> /b.txt") == 1, "exactly one starting notification");
    t.check(p.count("progress 5/5") == 1, "one progress report for a small file");
    t.check(fs.content("/b.txt") == "hello", "target content");
    t.check(fs.attributeCopies() == 1, "attributes preserved by default");

    std::ostringstream out;
    fileops::BatchPolicy batch(out);
    auto again = makeTask(fs, OperationKind::Copy, {{"/a.txt", "/c.txt"}});
    batch.start(*again);
    t.check(out.str() == "/a.txt -> /c.txt\n", "batch prints one line per entry");
    t.check(again->state() == TaskState::Dead, "batch copy should end dead");
}

void test_copy_into_directory(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a.txt", "x");
    fs.addDir("/dir");
    auto task = makeTask(fs, OperationKind::Copy, {{"/a.txt", "/dir"}}, 1024, false);
    RecordingPolicy p;
    run(*task, p);
    t.check(fs.content("/dir/a.txt") == "x", "copy into directory keeps the base name");
    t.check(fs.attributeCopies() == 0, "no attribute copies without preserve");
}

void test_copy_tree(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/src/one", "1");
    fs.addFile("/src/sub/two", "22");
    fs.addSymlink("/src/link", "one");
    auto task = makeTask(fs, OperationKind::Copy, {{"/src", "/out"}});
    RecordingPolicy p;
    t.check(run(*task, p) == TaskState::Dead, "tree copy should end dead");
    t.check(fs.content("/out/one") == "1", "top-level file copied");
    t.check(fs.content("/out/sub/two") == "22", "nested file copied");
    const auto *ln = fs.statOf("/out/link");
    t.check(ln && ln->kind == fileops::EntryKind::Symlink, "link copied as a link");
    t.check(fs.exists("/src/one"), "copy keeps sources");
    t.check(!p.log.empty() && p.log.front() == "start copy /src -> /out",
            "directory announced before its children");
}

void test_update_skips_up_to_date(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a", "new", 100);
    fs.addFile("/b", "old", 200);
    fs.addFile("/c", "new", 300);
    fs.addFile("/d", "old", 250);
    RecordingPolicy p;
    p.overwrite = Decision(DecisionTag::Update);
    auto task = makeTask(fs, OperationKind::Copy, {{"/a", "/b"}, {"/c", "/d"}});
    run(*task, p);
    t.check(fs.content("/b") == "old", "newer target should be kept");
    t.check(fs.content("/d") == "new", "older target should be replaced");
    t.check(p.count("overwrite") == 2, "both conflicts reach the policy");
}

void test_reget_appends_tail(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a", "hello world");
    fs.addFile("/b", "hello");
    RecordingPolicy p;
    p.overwrite = Decision(DecisionTag::Reget);
    auto task = makeTask(fs, OperationKind::Copy, {{"/a", "/b"}}, 4);
    run(*task, p);
    t.check(fs.content("/b") == "hello world", "reget should append the missing tail");
    t.check(p.count("progress 9/11") == 1, "progress counts from the existing size");
}

void test_same_file_is_an_io_error(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a", "data");
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Copy, {{"/a", "/a"}});
    run(*task, p);
    t.check(p.ioMessages.size() == 1, "copying a file onto itself is reported");
    if (!p.ioMessages.empty())
        t.checkContains(p.ioMessages[0], "are the same file", "same-file message");
    t.check(fs.content("/a") == "data", "file untouched");
}

void test_missing_source_and_special_files(TestContext &t) {
    MockFileSystem fs;
    fs.addSpecial("/pipe", fileops::EntryKind::Fifo);
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Copy, {{"/nope", "/x"}, {"/pipe", "/y"}});
    t.check(run(*task, p) == TaskState::Dead, "skipped errors still end dead");
    t.check(p.ioMessages.size() == 2, "two io errors");
    if (p.ioMessages.size() == 2) {
        t.checkContains(p.ioMessages[0], "Cannot stat source file \"/nope\"\n",
                        "missing source message");
        t.checkContains(p.ioMessages[1], "files of type 'fifo'", "special file message");
    }
}

void test_io_errors_on_open(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/src/a", "1");
    fs.addFile("/src/b", "2");
    fs.injectFault(MockFileSystem::Op::OpenRead, "/src/a", EACCES);
    fs.injectFault(MockFileSystem::Op::OpenRead, "/src/b", EACCES);
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Copy, {{"/src", "/out"}});
    run(*task, p);
    t.check(p.ioMessages.size() == 2, "every failing entry reports an io error");
    if (!p.ioMessages.empty())
        t.checkContains(p.ioMessages[0], "Cannot open source file \"/src/a\"",
                        "open failure message");
    t.check(fs.exists("/out") && !fs.exists("/out/a"), "failed entries are skipped");
}

void test_abort_after_progress_asks_partial(TestContext &t) {
    for (DecisionTag answer : {DecisionTag::Delete, DecisionTag::Keep}) {
        MockFileSystem fs;
        fs.addFile("/src.bin", "0123456789");
        RecordingPolicy p;
        p.partial = Decision(answer);
        auto task = makeTask(fs, OperationKind::Copy, {{"/src.bin", "/dst.bin"}}, 4);
        fileops::Pump pump(*task, p);
        while (pump.step()) {
            if (pump.last() && pump.last()->kind == SuspensionKind::Progress) {
                pump.requestAbort();
                break;
            }
        }
        while (pump.step()) {
        }
        t.check(p.count("partial") == 1, "exactly one partial decision after abort");
        t.check(pump.outcome() == TaskState::Terminated, "aborted task ends terminated");
        if (answer == DecisionTag::Delete)
            t.check(!fs.exists("/dst.bin"), "partial target deleted");
        else
            t.check(fs.content("/dst.bin") == "0123", "partial target kept");
        t.check(fs.exists("/src.bin"), "source untouched by abort");
    }
}

void test_write_error_then_partial(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/src.bin", "0123456789");
    fs.injectFault(MockFileSystem::Op::Write, "/dst.bin", ENOSPC, 1);
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Copy, {{"/src.bin", "/dst.bin"}}, 4);
    run(*task, p);
    t.check(p.ioMessages.size() == 1, "write failure reported once");
    if (!p.ioMessages.empty())
        t.checkContains(p.ioMessages[0], "Cannot write target file", "write failure message");
    t.check(p.count("partial") == 1, "skipping a half-written file asks about it");
    t.check(!fs.exists("/dst.bin"), "partial file deleted");
}

void test_read_error_abort_keeps_partial(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/src.bin", "0123456789");
    fs.injectFault(MockFileSystem::Op::Read, "/src.bin", EIO, 1);
    RecordingPolicy p;
    p.ioError = Decision(DecisionTag::Abort);
    p.partial = Decision(DecisionTag::Keep);
    auto task = makeTask(fs, OperationKind::Copy, {{"/src.bin", "/dst.bin"}}, 4);
    t.check(run(*task, p) == TaskState::Terminated, "abort ends terminated");
    t.check(p.count("partial") == 1, "abort after a read error asks about the partial file");
    t.check(fs.content("/dst.bin") == "0123", "kept partial content");
}

void test_abort_answer_stops_remaining_transfers(TestContext &t) {
    {
        MockFileSystem fs;
        fs.addFile("/a", "new");
        fs.addFile("/b", "old");
        fs.addFile("/c", "c");
        RecordingPolicy p;
        p.overwrite = Decision(DecisionTag::Abort);
        auto task = makeTask(fs, OperationKind::Copy, {{"/a", "/b"}, {"/c", "/d"}});
        int late = 0;
        t.check(runWatched(*task, p, late) == TaskState::Terminated,
                "overwrite answered abort ends terminated");
        t.check(late == 0, "no resume after an overwrite abort");
        t.check(fs.content("/b") == "old", "conflicting target untouched");
        t.check(!fs.exists("/d"), "later transfer not started after overwrite abort");
        t.check(p.count("start copy /c") == 0, "later transfer never announced");
        t.check(p.count("partial") == 0, "nothing written, no partial question");
    }
    {
        MockFileSystem fs;
        fs.addFile("/c", "c");
        RecordingPolicy p;
        p.ioError = Decision(DecisionTag::Abort);
        auto task = makeTask(fs, OperationKind::Copy, {{"/nope", "/x"}, {"/c", "/d"}});
        int late = 0;
        t.check(runWatched(*task, p, late) == TaskState::Terminated,
                "io error answered abort ends terminated");
        t.check(late == 0, "no resume after an io error abort");
        t.check(!fs.exists("/d"), "later transfer not started after io error abort");
        t.check(p.count("io_error") == 1, "one io error before the abort");
    }
    {
        MockFileSystem fs;
        fs.addFile("/d1/a", "1");
        fs.addFile("/d2/b", "2");
        RecordingPolicy p;
        p.nonEmpty = Decision(DecisionTag::Abort);
        auto task = makeTask(fs, OperationKind::Delete, {{"/d1", ""}, {"/d2", ""}});
        int late = 0;
        t.check(runWatched(*task, p, late) == TaskState::Terminated,
                "non-empty directory answered abort ends terminated");
        t.check(late == 0, "no resume after a non-empty directory abort");
        t.check(fs.exists("/d1/a") && fs.exists("/d2/b"), "abort deletes nothing");
        t.check(p.count("non_empty") == 1, "second directory never asked about");
    }
}

void test_abort_after_starting_terminates(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a", "abc");
    fs.addFile("/c", "c");
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Copy, {{"/a", "/b"}, {"/c", "/d"}});
    WatchedTask watched(*task);
    fileops::Pump pump(watched, p);
    t.check(pump.step() && pump.last() && pump.last()->kind == SuspensionKind::Starting,
            "first step announces the entry");
    pump.requestAbort();
    while (pump.step()) {
    }
    t.check(pump.outcome() == TaskState::Terminated, "abort after starting ends terminated");
    t.check(watched.resumesAfterEnd == 0, "no resume after the terminal result");
    t.check(!fs.exists("/b") && !fs.exists("/d"), "nothing copied after abort");
}

void test_abort_mid_transfer_skips_rest(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/big", "0123456789");
    fs.addFile("/c", "c");
    RecordingPolicy p;
    p.partial = Decision(DecisionTag::Keep);
    auto task = makeTask(fs, OperationKind::Copy, {{"/big", "/out"}, {"/c", "/d"}}, 4);
    WatchedTask watched(*task);
    fileops::Pump pump(watched, p);
    while (pump.step()) {
        if (pump.last() && pump.last()->kind == SuspensionKind::Progress)
            pump.requestAbort();
    }
    t.check(pump.outcome() == TaskState::Terminated, "abort mid transfer ends terminated");
    t.check(watched.resumesAfterEnd == 0, "no resume after the terminal result");
    t.check(p.count("partial") == 1 && p.count("progress") == 1,
            "one chunk then one partial question");
    t.check(fs.content("/out") == "0123", "kept partial holds the first chunk");
    t.check(!fs.exists("/d"), "later transfer not started");
}

void test_skip_after_starting(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a", "abc");
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Copy, {{"/a", "/b"}});
    fileops::Pump pump(*task, p);
    pump.step();
    pump.requestSkip();
    while (pump.step()) {
    }
    t.check(!fs.exists("/b"), "skipped entry is not copied");
    t.check(pump.outcome() == TaskState::Dead, "skip does not end the task");
}

void test_move_same_device_renames(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a", "abc");
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Move, {{"/a", "/b"}});
    run(*task, p);
    t.check(!fs.exists("/a") && fs.content("/b") == "abc", "rename moves the file");
    t.check(p.count("progress") == 0, "rename copies no bytes");
}

void test_move_across_devices(TestContext &t) {
    MockFileSystem fs;
    fs.addDir("/mnt");
    fs.addMount("/mnt");
    fs.addFile("/d/f1", "1");
    fs.addFile("/d/sub/f2", "22");
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Move, {{"/d", "/mnt/d2"}});
    t.check(run(*task, p) == TaskState::Dead, "cross-device move ends dead");
    t.check(fs.content("/mnt/d2/f1") == "1", "file copied across devices");
    t.check(fs.content("/mnt/d2/sub/f2") == "22", "nested file copied across devices");
    t.check(!fs.exists("/d"), "source tree removed after copy");
    t.check(p.decisions() == 0, "no decisions for a clean move");
}

void test_move_into_itself(TestContext &t) {
    MockFileSystem fs;
    fs.addDir("/d/sub");
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Move, {{"/d", "/d/sub"}});
    run(*task, p);
    t.check(p.ioMessages.size() == 1, "moving into itself is an io error");
    if (!p.ioMessages.empty())
        t.checkContains(p.ioMessages[0], "a subdirectory", "EINVAL message");
    t.check(fs.exists("/d/sub") && !fs.exists("/d/sub/d"), "tree untouched");
}

void test_move_keeps_dir_with_failed_child(TestContext &t) {
    MockFileSystem fs;
    fs.addDir("/mnt");
    fs.addMount("/mnt");
    fs.addFile("/d/a", "1");
    fs.addFile("/d/b", "2");
    fs.injectFault(MockFileSystem::Op::OpenRead, "/d/b", EACCES);
    RecordingPolicy p;
    auto task = makeTask(fs, OperationKind::Move, {{"/d", "/mnt/d"}});
    run(*task, p);
    t.check(!fs.exists("/d/a"), "moved child removed");
    t.check(fs.exists("/d/b"), "failed child kept");
    t.check(fs.exists("/d"), "directory with leftovers kept");
}

void test_delete_non_empty_dir(TestContext &t) {
    {
        MockFileSystem fs;
        fs.addFile("/d/a", "1");
        fs.addFile("/d/sub/b", "2");
        RecordingPolicy p;
        auto task = makeTask(fs, OperationKind::Delete, {{"/d", ""}});
        t.check(run(*task, p) == TaskState::Dead, "delete ends dead");
        t.check(p.count("non_empty") == 1, "only the top directory asks");
        t.check(!fs.exists("/d"), "tree deleted");
        t.check(!p.log.empty() && p.log.front() == "start delete /d",
                "delete notification carries no target");
    }
    {
        MockFileSystem fs;
        fs.addFile("/d/a", "1");
        RecordingPolicy p;
        p.nonEmpty = Decision(DecisionTag::Skip);
        auto task = makeTask(fs, OperationKind::Delete, {{"/d", ""}});
        run(*task, p);
        t.check(fs.exists("/d/a"), "skipped directory kept");
    }
    {
        MockFileSystem fs;
        fs.addDir("/empty");
        RecordingPolicy p;
        auto task = makeTask(fs, OperationKind::Delete, {{"/empty", ""}});
        run(*task, p);
        t.check(p.decisions() == 0 && !fs.exists("/empty"), "empty directory deleted silently");
    }
}

void test_transfer_arguments(TestContext &t) {
    std::vector<fileops::Transfer> out;
    std::string err;
    t.check(fileops::canonicalTransfers({"/a", "/b"}, {"/x"}, out, err) && out.size() == 2 &&
                out[1].target == "/x",
            "one target is shared by all sources");
    t.check(!fileops::canonicalTransfers({"/a", "/b", "/c"}, {"/x", "/y"}, out, err),
            "mismatched lists rejected");
    t.checkContains(err, "different lengths", "mismatch message");

    MockFileSystem fs;
    fileops::TaskOptions o;
    err.clear();
    t.check(!fileops::createTask(fs, OperationKind::Delete, {"/a"}, std::string("/x"), o, err),
            "delete rejects a destination");
    err.clear();
    t.check(!fileops::createTask(fs, OperationKind::Copy, {"/a"}, std::nullopt, o, err),
            "copy requires a destination");
    t.check(!err.empty(), "missing destination explained");
}

template <typename F> bool throwsContract(F &&f) {
    try {
        f();
    } catch (const fileops::ContractError &) {
        return true;
    }
    return false;
}

void test_task_contract_violations(TestContext &t) {
    MockFileSystem fs;
    fs.addFile("/a", "x");
    fs.addFile("/b", "y");

    auto first = makeTask(fs, OperationKind::Copy, {{"/a", "/c"}});
    t.check(throwsContract([&] { first->resume(DecisionTag::Skip); }),
            "first resume must be empty");

    auto conflict = makeTask(fs, OperationKind::Copy, {{"/a", "/b"}});
    conflict->resume(std::nullopt); // starting
    t.check(throwsContract([&] { conflict->resume(DecisionTag::Overwrite); }),
            "notification cannot be answered with overwrite");

    auto missing = makeTask(fs, OperationKind::Copy, {{"/a", "/b"}});
    missing->resume(std::nullopt);
    const auto s = missing->resume(std::nullopt);
    t.check(s.kind == SuspensionKind::NeedOverwriteDecision, "conflict suspends for a decision");
    t.check(throwsContract([&] { missing->resume(std::nullopt); }),
            "decision needs an answer");

    auto illegal = makeTask(fs, OperationKind::Copy, {{"/a", "/b"}});
    illegal->resume(std::nullopt);
    illegal->resume(std::nullopt);
    t.check(throwsContract([&] { illegal->resume(DecisionTag::Keep); }),
            "keep is not an overwrite answer");

    auto done = makeTask(fs, OperationKind::Copy, {});
    t.check(done->resume(std::nullopt).kind == SuspensionKind::Dead, "empty task is dead at once");
    t.check(done->finished(), "dead task is finished");
    t.check(throwsContract([&] { done->resume(std::nullopt); }), "no resume after the end");
}

} // namespace

int main() {
    TestContext t;
    test_wire_names(t);
    test_legal_answers(t);
    test_progress_percent(t);
    test_policy_state_memo(t);
    test_batch_answers_constant(t);
    test_pump_routes_in_order(t);
    test_pump_abort_and_skip_requests(t);
    test_pump_rejects_illegal_answer(t);
    test_pump_rejects_zero_whole(t);
    test_batch_copy_single_file(t);
    test_copy_into_directory(t);
    test_copy_tree(t);
    test_update_skips_up_to_date(t);
    test_reget_appends_tail(t);
    test_same_file_is_an_io_error(t);
    test_missing_source_and_special_files(t);
    test_io_errors_on_open(t);
    test_abort_after_progress_asks_partial(t);
    test_write_error_then_partial(t);
    test_read_error_abort_keeps_partial(t);
    test_abort_answer_stops_remaining_transfers(t);
    test_abort_after_starting_terminates(t);
    test_abort_mid_transfer_skips_rest(t);
    test_skip_after_starting(t);
    test_move_same_device_renames(t);
    test_move_across_devices(t);
    test_move_into_itself(t);
    test_move_keeps_dir_with_failed_child(t);
    test_delete_non_empty_dir(t);
    test_transfer_arguments(t);
    test_task_contract_violations(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] fileops_core_tests\n";
    return EXIT_SUCCESS;
}
