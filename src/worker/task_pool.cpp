#include <surge/worker/task_pool.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace surge::worker {

namespace {

// Pause between completion checks while draining.
constexpr std::chrono::milliseconds kDrainPollInterval{5};

} // namespace

std::vector<OperationKind> TaskPool::activeKinds(const config::OperationMix& mix) {
    std::vector<OperationKind> kinds;
    if (mix.pointLookupPct > 0.0)
        kinds.push_back(OperationKind::PointLookup);
    if (mix.rangeScanPct > 0.0)
        kinds.push_back(OperationKind::RangeScan);
    if (mix.insertPct > 0.0)
        kinds.push_back(OperationKind::Insert);
    if (mix.updatePct > 0.0)
        kinds.push_back(OperationKind::Update);
    return kinds;
}

TaskPool::TaskPool(Config config, Dependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)), rng_(config_.seed) {
    const std::pair<OperationKind, double> shares[] = {
        {OperationKind::PointLookup, config_.mix.pointLookupPct},
        {OperationKind::RangeScan, config_.mix.rangeScanPct},
        {OperationKind::Insert, config_.mix.insertPct},
        {OperationKind::Update, config_.mix.updatePct},
    };
    for (const auto& [kind, pct] : shares) {
        if (pct > 0.0) {
            weights_.emplace_back(kind, pct);
            totalWeight_ += pct;
        }
    }
    if (weights_.empty()) {
        weights_.emplace_back(OperationKind::PointLookup, 100.0);
        totalWeight_ = 100.0;
    }
}

TaskPool::~TaskPool() {
    std::scoped_lock lock(mutex_);
    for (auto& [id, state] : tasks_) {
        state->stop.store(true, std::memory_order_release);
    }
}

void TaskPool::scaleTo(int target) {
    target = std::max(target, 0);
    std::scoped_lock lock(mutex_);
    pruneLocked();

    const int running = static_cast<int>(tasks_.size());
    if (running < target) {
        for (int i = running; i < target; ++i) {
            spawnTask(nextTaskId_++);
        }
    } else if (running > target) {
        int surplus = running - target;
        while (surplus-- > 0 && !tasks_.empty()) {
            auto last = std::prev(tasks_.end());
            last->second->stop.store(true, std::memory_order_release);
            draining_.push_back(last->second);
            tasks_.erase(last);
        }
    }

    if (currentTarget_ != target) {
        spdlog::debug("[TaskPool] {} scaled {} -> {} (draining {})", config_.workerId,
                      currentTarget_, target, draining_.size());
    }
    currentTarget_ = target;
}

void TaskPool::pruneLocked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second->done.load(std::memory_order_acquire)) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
    draining_.erase(std::remove_if(draining_.begin(), draining_.end(),
                                   [](const auto& s) {
                                       return s->done.load(std::memory_order_acquire);
                                   }),
                    draining_.end());
}

void TaskPool::spawnTask(int id) {
    auto state = std::make_shared<TaskState>();
    state->id = id;
    tasks_.emplace(id, state);
    boost::asio::co_spawn(deps_.executor, runTask(state), boost::asio::detached);
}

OperationKind TaskPool::pickKind() {
    if (weights_.size() == 1)
        return weights_.front().first;
    std::scoped_lock lock(rngMutex_);
    std::uniform_real_distribution<double> dist(0.0, totalWeight_);
    double roll = dist(rng_);
    for (const auto& [kind, weight] : weights_) {
        if (roll < weight)
            return kind;
        roll -= weight;
    }
    return weights_.back().first;
}

boost::asio::awaitable<void> TaskPool::runTask(std::shared_ptr<TaskState> state) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);
    int64_t completed = 0;

    auto stopping = [this, &state]() {
        return state->stop.load(std::memory_order_acquire) ||
               (deps_.stopRequested && deps_.stopRequested->load(std::memory_order_acquire));
    };

    while (!stopping()) {
        const auto kind = pickKind();
        OperationOutcome outcome;
        try {
            const auto key = deps_.values ? deps_.values->nextValue(config_.workerId, kind)
                                          : std::string{};
            if (deps_.pool)
                co_await deps_.pool->acquire();
            try {
                outcome = co_await deps_.target->execute(kind, key);
            } catch (const std::exception& e) {
                outcome = OperationOutcome{0.0, false, e.what()};
            }
            if (deps_.pool)
                deps_.pool->release();
        } catch (const std::exception& e) {
            outcome = OperationOutcome{0.0, false, e.what()};
        }
        if (deps_.metrics)
            deps_.metrics->record(kind, outcome);

        ++completed;
        if (config_.operationsPerTask > 0 && completed >= config_.operationsPerTask)
            break;

        if (config_.thinkTime.count() > 0) {
            timer.expires_after(config_.thinkTime);
            try {
                co_await timer.async_wait(boost::asio::use_awaitable);
            } catch (const boost::system::system_error& e) {
                if (e.code() == boost::asio::error::operation_aborted)
                    break;
                throw;
            }
        } else {
            co_await boost::asio::post(executor, boost::asio::use_awaitable);
        }
    }

    spdlog::trace("[TaskPool] {} task {} finished after {} operations", config_.workerId,
                  state->id, completed);
    state->done.store(true, std::memory_order_release);
}

boost::asio::awaitable<bool> TaskPool::stopAll(std::chrono::milliseconds timeout) {
    {
        std::scoped_lock lock(mutex_);
        for (auto& [id, state] : tasks_) {
            state->stop.store(true, std::memory_order_release);
            draining_.push_back(state);
        }
        tasks_.clear();
        currentTarget_ = 0;
    }

    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        {
            std::scoped_lock lock(mutex_);
            pruneLocked();
            if (draining_.empty())
                co_return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
            break;
        timer.expires_after(kDrainPollInterval);
        try {
            co_await timer.async_wait(boost::asio::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (e.code() != boost::asio::error::operation_aborted)
                throw;
            break;
        }
    }

    spdlog::warn("[TaskPool] {} drain timed out with {} task(s) still in flight",
                 config_.workerId, drainingCount());
    co_return false;
}

int TaskPool::currentTarget() const {
    std::scoped_lock lock(mutex_);
    return currentTarget_;
}

int TaskPool::runningCount() const {
    std::scoped_lock lock(mutex_);
    int running = 0;
    for (const auto& [id, state] : tasks_) {
        if (!state->done.load(std::memory_order_acquire))
            ++running;
    }
    return running;
}

int TaskPool::drainingCount() const {
    std::scoped_lock lock(mutex_);
    int draining = 0;
    for (const auto& state : draining_) {
        if (!state->done.load(std::memory_order_acquire))
            ++draining;
    }
    return draining;
}

} // namespace surge::worker
