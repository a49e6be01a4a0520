#pragma once

#include <atomic>
#include <memory>

namespace sdlmodel {

    class CancellationToken {
        std::shared_ptr<std::atomic<bool>> flag;

    public:
        CancellationToken() = default;
        explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag(std::move(flag)) {}

        // A default-constructed token is never cancelled.
        bool cancelled() const { return flag && flag->load(); }
    };

    class CancellationSource {
        std::shared_ptr<std::atomic<bool>> flag{std::make_shared<std::atomic<bool>>(false)};

    public:
        CancellationToken token() const { return CancellationToken{flag}; }
        void cancel() { flag->store(true); }
        bool cancelled() const { return flag->load(); }
    };

}
