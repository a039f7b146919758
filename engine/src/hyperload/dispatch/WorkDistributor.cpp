#include <hyperload/dispatch/WorkDistributor.hpp>

#include <hyperload/core/Logger.hpp>
#include <hyperload/core/ThreadTag.hpp>

#include <chrono>
#include <format>
#include <stdexcept>
#include <system_error>

namespace hyperload::dispatch
{

WorkDistributor::WorkDistributor(exec::ExecutorFactory factory) : factory_(std::move(factory))
{
    if (!factory_)
        throw std::invalid_argument("[WorkDistributor] executor factory is empty");
}

WorkDistributor::~WorkDistributor()
{
    for (auto &t : threads_)
        if (t.joinable())
            t.join();
}

void WorkDistributor::start(const std::vector<WorkAssignment> &plan, stats::ResultChannel::Sender tx)
{
    if (!threads_.empty())
        throw std::logic_error("[WorkDistributor] already started");

    // 워커가 참조로 쓰므로 스레드 생성 전에 크기를 확정한다
    outcomes_.resize(plan.size());
    threads_.reserve(plan.size());

    for (std::size_t i = 0; i < plan.size(); ++i)
    {
        WorkerOutcome &out = outcomes_[i];
        out.workerIndex = plan[i].workerIndex;
        out.assigned = plan[i].units;

        try
        {
            threads_.emplace_back([this, a = plan[i], tx, &out]() mutable { workerMain_(a, std::move(tx), out); });
        }
        catch (const std::system_error &e)
        {
            out.abnormal = true;
            out.reason = std::format("thread spawn failed: {}", e.what());
            HLOG_ERROR("Dispatch", "SpawnFailed", "worker={} units={} err='{}'", out.workerIndex, out.assigned,
                       e.what());
        }
    }

    HLOG_INFO("Dispatch", "WorkersStarted", "workers={} spawned={}", plan.size(), threads_.size());
    tx.release();
}

std::vector<WorkerOutcome> WorkDistributor::joinAll()
{
    for (auto &t : threads_)
        if (t.joinable())
            t.join();
    threads_.clear();

    return outcomes_;
}

void WorkDistributor::workerMain_(WorkAssignment assignment, stats::ResultChannel::Sender tx, WorkerOutcome &out)
{
    core::ThreadTag::bindWorker(static_cast<int>(assignment.workerIndex));
    HLOG_DEBUG("Worker", "ThreadStarted", "units={}", assignment.units);

    try
    {
        auto executor = factory_(assignment.workerIndex);
        if (!executor)
            throw std::runtime_error("executor factory returned null");

        for (std::size_t n = 0; n < assignment.units; ++n)
        {
            const auto begin = std::chrono::steady_clock::now();
            stats::RequestResult result;
            try
            {
                result = executor->execute();
            }
            catch (const std::exception &e)
            {
                HLOG_WARN("Worker", "ExecutorThrew", "unit={} err='{}'", n, e.what());
                result = stats::RequestResult::failed(std::chrono::steady_clock::now() - begin,
                                                      std::format("{}: {}", stats::kWorkerTaskFailureKey, e.what()));
            }

            if (!tx.send(std::move(result)))
                throw std::runtime_error("result channel closed");
            ++out.reported;
        }
    }
    catch (const std::exception &e)
    {
        out.abnormal = true;
        out.reason = e.what();
        HLOG_ERROR("Worker", "Aborted", "assigned={} reported={} err='{}'", out.assigned, out.reported, e.what());
    }
    catch (...)
    {
        out.abnormal = true;
        out.reason = "non-standard exception";
        HLOG_ERROR("Worker", "Aborted", "assigned={} reported={} err='non-standard exception'", out.assigned,
                   out.reported);
    }

    tx.release();
    HLOG_DEBUG("Worker", "ThreadExiting", "reported={}", out.reported);
}

} // namespace hyperload::dispatch
