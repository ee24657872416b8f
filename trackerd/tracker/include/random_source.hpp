#pragma once
#include <cstdint>
#include <random>


namespace trackerd::tracker {


    struct IRandomSource
    {
        virtual ~IRandomSource() = default;
        virtual std::uint64_t nextU64() = 0;
    };


    /// Uniform 64-bit values for connection ids. Not a CSPRNG.
    class Mt64RandomSource : public IRandomSource {
    public:
        Mt64RandomSource();
        explicit Mt64RandomSource(std::uint64_t seed) : rng_(seed) {}

        std::uint64_t nextU64() override;

    private:
        std::mt19937_64 rng_;
    };


} // namespace trackerd::tracker
