#include "../include/random_source.hpp"


namespace trackerd::tracker {


    static std::mt19937_64 seededEngine() {
        std::random_device rd;
        std::seed_seq ss{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64{ss};
    }


    Mt64RandomSource::Mt64RandomSource() : rng_(seededEngine()) {}


    std::uint64_t Mt64RandomSource::nextU64() {
        return std::uniform_int_distribution<std::uint64_t>{}(rng_);
    }


} // namespace trackerd::tracker
