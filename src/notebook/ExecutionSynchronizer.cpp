#include "notebook/ExecutionSynchronizer.h"
#include "notebook/CellFormatter.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <thread>

namespace {
bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string rangeLabel(int start, int stop) {
    return std::to_string(start) + "-" + std::to_string(stop - 1);
}
} // namespace

SyncClock SyncClock::system() {
    SyncClock clock;
    clock.now = [] { return std::chrono::steady_clock::now(); };
    clock.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    return clock;
}

ExecutionSynchronizer::ExecutionSynchronizer(INotebookHost& host, Options options, SyncClock clock)
    : host(host), options(options), clock(std::move(clock)) {}

const char* ExecutionSynchronizer::stateName(State state) {
    switch (state) {
        case State::Idle: return "idle";
        case State::Issued: return "issued";
        case State::Polling: return "polling";
        case State::Completed: return "completed";
        case State::TimedOut: return "timed_out";
    }
    return "unknown";
}

bool ExecutionSynchronizer::issue(const std::vector<Cell>& cells, int start, int stop) {
    rangeStart = start;
    rangeStop = stop;
    watch.clear();
    codeCells = 0;
    polls = 0;

    for (const auto& cell : cells) {
        if (cell.index < start || cell.index >= stop) continue;
        if (cell.kind != CellKind::Code) continue;
        codeCells++;
        // empty cells never get a new marker; watching them would hang until the deadline
        if (isBlank(cell.content)) continue;
        watch[cell.index] = cell.executionOrder;
    }

    if (codeCells == 0) {
        return false;
    }

    startedAt = clock.now();
    deadline = startedAt + options.timeout;

    Logger::getInstance().debug("Issuing cell execution",
                                {{"startIndex", start}, {"stopIndex", stop},
                                 {"codeCells", codeCells}, {"watched", watch.size()}});
    host.executeRange(start, stop);
    current = State::Issued;
    return true;
}

ExecutionSynchronizer::State ExecutionSynchronizer::poll() {
    if (current == State::Issued) {
        current = State::Polling;
    }
    if (current != State::Polling) {
        return current;
    }

    polls++;
    std::vector<Cell> cells = host.getCells();

    // recomputed from scratch on every pass
    bool allComplete = true;
    for (auto it = watch.begin(); it != watch.end();) {
        auto found = std::find_if(cells.begin(), cells.end(),
                                  [&](const Cell& c) { return c.index == it->first; });
        if (found == cells.end() || found->kind != CellKind::Code) {
            Logger::getInstance().warn("Watched cell disappeared during execution, no longer waiting on it",
                                       {{"cellIndex", it->first}});
            it = watch.erase(it);
            continue;
        }
        if (found->executionOrder == it->second) {
            allComplete = false;
            break;
        }
        ++it;
    }

    if (allComplete) {
        current = State::Completed;
    } else if (clock.now() >= deadline) {
        current = State::TimedOut;
    }
    return current;
}

ExecutionSynchronizer::Report ExecutionSynchronizer::run(int start, int stop) {
    Report report;

    if (!issue(host.getCells(), start, stop)) {
        report.text = "# Cell Execution\n\nNo code cells found in the specified range (" +
                      rangeLabel(start, stop) + ").";
        return report;
    }

    while (true) {
        State s = poll();
        if (s == State::Completed) {
            // trailing outputs may still be arriving
            clock.sleep(options.settleDelay);
            break;
        }
        if (s == State::TimedOut) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock.now());
        clock.sleep(std::min(options.pollInterval, remaining));
    }

    report.finalState = current;
    report.codeCellCount = codeCells;
    report.watchedCount = static_cast<int>(watch.size());
    report.polls = polls;
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock.now() - startedAt);

    if (current == State::TimedOut) {
        Logger::getInstance().warn("Cell execution did not complete before the deadline",
                                   {{"startIndex", start}, {"stopIndex", stop},
                                    {"timeoutMs", options.timeout.count()}, {"polls", polls}});
    } else {
        Logger::getInstance().debug("Cell execution completed",
                                    {{"startIndex", start}, {"stopIndex", stop},
                                     {"elapsedMs", report.elapsed.count()}, {"polls", polls}});
    }

    report.text = buildReport(current == State::Completed);
    return report;
}

std::string ExecutionSynchronizer::buildReport(bool complete) {
    std::vector<Cell> executed;
    for (auto& cell : host.getCells()) {
        if (cell.index >= rangeStart && cell.index < rangeStop && cell.kind == CellKind::Code) {
            executed.push_back(std::move(cell));
        }
    }

    std::string result = "# Cell Execution Results\n\n";
    if (!complete) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count();
        result += "> Mind that not all cells completed execution within " + std::to_string(seconds) + " seconds!\n";
    }
    result += "Executed " + std::to_string(codeCells) + " code cells in range " +
              rangeLabel(rangeStart, rangeStop) + ".\n\n";
    result += CellFormatter::formatCells(executed, options.maxOutputSize);
    return result;
}
