#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "notebook/INotebookHost.h"

/**
 * @brief Time source for the synchronizer; tests substitute a manual clock.
 */
struct SyncClock {
    std::function<std::chrono::steady_clock::time_point()> now;
    std::function<void(std::chrono::milliseconds)> sleep;

    static SyncClock system();
};

/**
 * @brief Runs a cell range on the kernel and waits for it without a
 *        completion callback.
 *
 * The kernel never tells us when a cell is done, so completion is inferred:
 * before issuing the execute command every non-empty code cell in the range
 * has its completion marker recorded (the watch set). Polling re-reads the
 * live cells and finishes once every watched marker differs from its
 * snapshot, or when the deadline passes. Empty cells never receive a new
 * marker and are left out of the watch set.
 *
 *   Idle -> Issued -> Polling -> Completed | TimedOut
 *
 * A timeout is not an error: the report is built from whatever state exists
 * and carries a warning line.
 */
class ExecutionSynchronizer {
public:
    enum class State {
        Idle,
        Issued,
        Polling,
        Completed,
        TimedOut
    };

    struct Options {
        std::chrono::milliseconds pollInterval{200};
        std::chrono::milliseconds settleDelay{500};
        std::chrono::milliseconds timeout{30000};
        int maxOutputSize = 2000;
    };

    struct Report {
        State finalState = State::Idle;
        int codeCellCount = 0;
        int watchedCount = 0;
        int polls = 0;
        std::chrono::milliseconds elapsed{0};
        std::string text;

        bool complete() const { return finalState == State::Completed; }
        bool skipped() const { return codeCellCount == 0; }
    };

    ExecutionSynchronizer(INotebookHost& host, Options options, SyncClock clock = SyncClock::system());

    /**
     * @brief Execute `[start, stop)` and block until done or timed out.
     *
     * A range without code cells is reported as such and never reaches the
     * kernel.
     */
    Report run(int start, int stop);

    /**
     * Snapshots markers of the code cells in `[start, stop)` of `cells` and
     * sends the execute command. Returns false (state stays Idle) when the
     * range holds no code cell.
     */
    bool issue(const std::vector<Cell>& cells, int start, int stop);

    /** One polling step; returns the resulting state. */
    State poll();

    State state() const { return current; }
    const std::map<int, std::optional<long long>>& watchSet() const { return watch; }

    static const char* stateName(State state);

private:
    INotebookHost& host;
    Options options;
    SyncClock clock;

    State current = State::Idle;
    std::map<int, std::optional<long long>> watch;
    int codeCells = 0;
    int polls = 0;
    int rangeStart = 0;
    int rangeStop = 0;
    std::chrono::steady_clock::time_point startedAt;
    std::chrono::steady_clock::time_point deadline;

    std::string buildReport(bool complete);
};
