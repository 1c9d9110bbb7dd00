#include "passholder/crypto/KdfParams.hpp"

#include <cstdint>
#include <stdexcept>

namespace passholder::crypto
{
namespace
{

constexpr std::uint32_t g_kParallelismCap{ 16U };
constexpr std::uint32_t g_kMemoryKiBCap{ 1024U * 1024U };
constexpr std::uint32_t g_kIterationsCap{ 10U };

} // namespace

void requireArgon2idParamsSafe(const Argon2idParams& params)
{
    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("argon2id: invalid parameters");
    }
    if (params.parallelism > g_kParallelismCap || params.memoryKiB > g_kMemoryKiBCap ||
        params.iterations > g_kIterationsCap)
    {
        throw std::invalid_argument("argon2id: unsafe parameters");
    }
    if (const std::uint32_t minMemoryKiB{ params.parallelism * 8U }; params.memoryKiB < minMemoryKiB)
    {
        throw std::invalid_argument("argon2id: invalid parameters");
    }
    // Lane segments must divide memory evenly or implementations disagree on the rounding.
    if ((params.memoryKiB % (params.parallelism * 4U)) != 0U)
    {
        throw std::invalid_argument("argon2id: invalid parameters");
    }
}

} // namespace passholder::crypto
