#include <hyperload/dispatch/WorkAssignment.hpp>

#include <hyperload/core/Errors.hpp>

namespace hyperload::dispatch
{

std::vector<WorkAssignment> partitionWork(std::size_t totalUnits, std::size_t workers)
{
    if (totalUnits == 0)
        throw core::ConfigurationError("[Dispatch] total units must be > 0");
    if (workers == 0)
        throw core::ConfigurationError("[Dispatch] concurrency must be > 0");

    const std::size_t base = totalUnits / workers;
    const std::size_t extra = totalUnits % workers;

    std::vector<WorkAssignment> out;
    out.reserve(workers < totalUnits ? workers : totalUnits);

    for (std::size_t i = 0; i < workers; ++i)
    {
        const std::size_t units = base + (i < extra ? 1 : 0);
        if (units == 0)
            break; // 뒤쪽 워커도 모두 0
        out.push_back(WorkAssignment{static_cast<unsigned int>(i), units});
    }
    return out;
}

} // namespace hyperload::dispatch
