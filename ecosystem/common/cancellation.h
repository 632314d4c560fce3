#pragma once

#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

namespace gdp::common {

    namespace detail {

        struct cancellation_state {

            std::mutex mutex;
            std::condition_variable signal;
            bool cancelled = false;
            std::vector<std::weak_ptr<cancellation_state>> children;

            void cancel();
        };
    }

    // Observer side of a cancellation_source. Copies share the same state.
    class cancellation_token {

        public:

            cancellation_token() = default;

            bool is_cancelled() const;

            // Blocks until the deadline passes or the token is cancelled.
            // Returns true when cancelled.
            bool wait_until(const std::chrono::steady_clock::time_point &deadline) const;
            bool wait_for(const std::chrono::steady_clock::duration &duration) const;

        private:

            friend class cancellation_source;

            explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state);

            std::shared_ptr<detail::cancellation_state> state_;
    };

    // Owner side. A source built from parent tokens is cancelled as soon as any parent is.
    class cancellation_source {

        public:

            cancellation_source();
            cancellation_source(std::initializer_list<cancellation_token> parents);

            void cancel();
            bool is_cancelled() const;
            cancellation_token token() const;

        private:

            std::shared_ptr<detail::cancellation_state> state_;
    };
}
