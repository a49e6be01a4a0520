#pragma once

#include <atomic>

namespace sdlmodel {

    // Owns a native SDL resource (a pointer or an integer id) and releases it exactly once.
    // `Destroy` is invoked with the handle; a default-constructed `T` means "no resource".
    template <typename T, auto Destroy>
    class NativeHandle {
        std::atomic<T> handle;

    public:
        NativeHandle() : handle(T{}) {}
        explicit NativeHandle(T native) : handle(native) {}
        ~NativeHandle() { reset(); }

        NativeHandle(const NativeHandle&) = delete;
        NativeHandle& operator=(const NativeHandle&) = delete;

        T get() const { return handle.load(); }
        bool alive() const { return handle.load() != T{}; }

        // Releases the native resource. Returns false when it was already released.
        bool reset() {
            auto native = handle.exchange(T{});
            if (native == T{})
                return false;
            Destroy(native);
            return true;
        }

        // Takes ownership of `native`, releasing the previously held resource if any.
        void adopt(T native) {
            auto old = handle.exchange(native);
            if (old != T{})
                Destroy(old);
        }

        // Gives up ownership without destroying the resource.
        T release() { return handle.exchange(T{}); }
    };

}
