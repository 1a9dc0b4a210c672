#include "runner.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

#define BOOST_THREAD_VERSION 5
#include <boost/thread/executors/basic_thread_pool.hpp>
#include <boost/thread/future.hpp>

#include "errors.hpp"

namespace {

struct StatsObserver : SearchObserver {
    Outcome &out;

    explicit StatsObserver(Outcome &o) : out{ o } { }

    void placed(const Placement &, size_t) override { out.placed++; }
    void encoded(size_t variables, size_t clauses) override {
        out.variables = variables;
        out.clauses = clauses;
    }
};

struct Progress {
    std::atomic_size_t done, solved;
};

std::jthread monitor(const Progress &pr, size_t total) {
    using namespace std::chrono_literals;
    return std::jthread{ [&pr, total](std::stop_token st) {
        std::mutex mtx;
        std::condition_variable_any cv;
        std::unique_lock lock{ mtx };
        while (!cv.wait_for(lock, st, 1s, [] { return false; }) && !st.stop_requested()) {
            fmt::print(stderr, "Solving space {}/{} ({} solved so far)...\n",
                    pr.done.load(std::memory_order_relaxed), total,
                    pr.solved.load(std::memory_order_relaxed));
        }
    } };
}

void run_one(const Puzzle &pz, const Region &region, const Config &cfg, Outcome &out, Progress &pr) {
    StatsObserver obs{ out };
    SolveOptions opts{ cfg.max_steps, cfg.timeout_ms, &obs };
    auto t1 = std::chrono::steady_clock::now();
    try {
        out.solution = solve(cfg.strategy, pz.shapes, region, opts);
        out.verdict = out.solution ? Verdict::SOLVED : Verdict::UNSOLVABLE;
    } catch (const search_aborted &e) {
        out.verdict = Verdict::UNKNOWN;
        out.message = e.what();
    } catch (const std::exception &e) {
        out.verdict = Verdict::ERROR;
        out.message = e.what();
    }
    auto t2 = std::chrono::steady_clock::now();
    out.us = std::chrono::duration_cast<std::chrono::microseconds>(t2 - t1).count();
    if (out.verdict == Verdict::SOLVED)
        pr.solved.fetch_add(1, std::memory_order_relaxed);
    pr.done.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

std::string Report::summary() const {
    return fmt::format("{} / {} regions solved", solved, outcomes.size());
}

Report run_batch(const Puzzle &pz, const Config &cfg) {
    Report rep;
    rep.outcomes.resize(pz.regions.size());
    Progress pr{};

    auto t1 = std::chrono::steady_clock::now();
    {
        std::jthread j;
        if (cfg.progress)
            j = monitor(pr, pz.regions.size());

        if (cfg.jobs <= 1) {
            for (auto i = 0zu; i < pz.regions.size(); i++)
                run_one(pz, pz.regions[i], cfg, rep.outcomes[i], pr);
        } else {
            boost::basic_thread_pool pool{ cfg.jobs };
            for (auto i = 0zu; i < pz.regions.size(); i++)
                boost::async(pool, [&](size_t ii) {
                    run_one(pz, pz.regions[ii], cfg, rep.outcomes[ii], pr);
                }, i);
            pool.close();
            pool.join();
        }
    }
    auto t2 = std::chrono::steady_clock::now();
    rep.us = std::chrono::duration_cast<std::chrono::microseconds>(t2 - t1).count();

    for (auto &o : rep.outcomes) {
        switch (o.verdict) {
            case Verdict::SOLVED: rep.solved++; break;
            case Verdict::UNSOLVABLE: rep.unsolvable++; break;
            case Verdict::UNKNOWN: rep.unknown++; break;
            case Verdict::ERROR: rep.errors++; break;
        }
    }
    return rep;
}
