#pragma once
#include <cmath>
#include <cstdint>

class pcg32 {
    public:
        using result_type = uint32_t;
        pcg32(uint64_t seed = 0, uint64_t stream = 1) {seed_rng(seed, stream);}

        void seed_rng(uint64_t seed, uint64_t stream = 1) {
            state_ = 0;
            inc_ = (stream << 1u) | 1u;
            next_uint();
            state_ += seed;
            next_uint();
        }

        result_type next_uint() {
            uint64_t oldstate = state_;
            state_ = oldstate * multiplier_ + inc_;

            uint32_t xorshifted = static_cast<uint32_t>(
                ((oldstate >> 18u) ^ oldstate) >> 27u
            );
            uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);

            return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
        }

        uint32_t operator()() {return next_uint();}

        static constexpr uint32_t min() {return 0;}
        static constexpr uint32_t max() {return UINT32_MAX;}

        // (0,1) with 32-bit precision
        double uniform() {return (next_uint() + 0.5) * inv_uint32_;}

        // Box-Muller, one draw per call
        double standard_normal() {
            const double u1 = uniform();
            const double u2 = uniform();
            return std::sqrt(-2.0 * std::log(u1)) * std::cos(6.283185307179586 * u2);
        }

    private:
        uint64_t state_ = 0;
        uint64_t inc_ = 0;

        static constexpr uint64_t multiplier_ = 6364136223846793005ULL;
        static constexpr double inv_uint32_ = 1.0 / 4294967296.0;
};
