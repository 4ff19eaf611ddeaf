// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/sources.h>

#include "fork_handler.h"

#include <chacha20.hpp>
#include <randutils.hpp>

using namespace mulid;
using namespace std::chrono;

auto system_time_source::now() -> int64_t {
    auto since_epoch = floor<milliseconds>(system_clock::now().time_since_epoch());
    return int64_t(since_epoch.count());
}

namespace {

    using prng = chacha20_12;
    static_assert(prng::min() == 0 && prng::max() == std::numeric_limits<prng::result_type>::max());

    struct seeded_prng : prng {
        seeded_prng():
            prng(randutils::auto_seed_128{}.base())
        {}
    };

    //Holds no state of its own. Every thread draws from its own engine.
    class chacha_random_source final : public random_source {
    public:
        void fill(std::span<uint8_t> dest) override {
            prng & gen = impl::per_thread_instance<seeded_prng>::get();
            auto it = dest.begin();
            while (it != dest.end()) {
                auto word = gen();
                for (size_t i = 0; i != sizeof(word) && it != dest.end(); ++i, ++it) {
                    *it = uint8_t(word);
                    word >>= 8;
                }
            }
        }
    };
}

auto mulid::make_default_random_source() -> std::unique_ptr<random_source> {
    return std::make_unique<chacha_random_source>();
}
