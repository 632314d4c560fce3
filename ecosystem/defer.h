#pragma once

#include <utility>

#define GDP_CONCAT_(a, b) a ## b
#define GDP_CONCAT(a, b) GDP_CONCAT_(a, b)

// Runs the given statement when the enclosing scope exits. Guards declared later run first.
#define DEFER(fn) auto GDP_CONCAT(__defer__, __LINE__) = gdp::make_scope_guard([&] ( ) { fn ; })

/*

Examples:

    DEFER(events.close());

    DEFER({
        arv_shutdown();
        spdlog::debug("Aravis has been shut down.");
    });

*/

namespace gdp {

    template<class callable>
    class scope_guard {
        public:
            explicit scope_guard(callable &&fn) : fn_(std::move(fn)) {}
            scope_guard(scope_guard &&other) : fn_(std::move(other.fn_)), armed_(other.armed_) { other.armed_ = false; }
            ~scope_guard() { if (armed_) fn_(); }
            scope_guard(const scope_guard &) = delete;
            void operator=(const scope_guard &) = delete;
        private:
            callable fn_;
            bool armed_ = true;
    };

    template<class callable>
    scope_guard<callable> make_scope_guard(callable &&fn) {
        return scope_guard<callable>(std::forward<callable>(fn));
    }
}
