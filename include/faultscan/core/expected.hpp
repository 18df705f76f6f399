#pragma once
#include <new>          // placement new
#include <utility>      // move, forward
#include <type_traits>

#include "faultscan/core/status.hpp"

namespace faultscan{

    // // Value-or-Status holder. The core never throws, so fallible calls return one of these.
    // // T lives in an inline buffer; no heap is touched by the holder itself.
    template <class T>
    class Expected{
        static_assert(!std::is_reference_v<T>, "Expected<T&> is not supported");

        public:
            [[nodiscard]] static Expected success(const T& v) noexcept(std::is_nothrow_copy_constructible_v<T>){
                Expected e;
                e.construct_(v);
                return e;
            }

            [[nodiscard]] static Expected success(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>){
                Expected e;
                e.construct_(std::move(v));
                return e;
            }

            // kOK is not a failure; callers passing it get kInvalidArg back
            [[nodiscard]] static Expected failure(Status s) noexcept{
                Expected e;
                e.status_ = (s == Status::kOK) ? Status::kInvalidArg : s;
                return e;
            }

            Expected(const Expected& o) noexcept(std::is_nothrow_copy_constructible_v<T>) : status_(o.status_){
                if (o.engaged_) construct_(*o.get_());
            }

            Expected(Expected&& o) noexcept(std::is_nothrow_move_constructible_v<T>) : status_(o.status_){
                if (o.engaged_) construct_(std::move(*o.get_()));
                o.destroy_();
            }

            Expected& operator=(const Expected& o) noexcept(std::is_nothrow_copy_constructible_v<T>){
                if (this == &o) return *this;
                destroy_();
                status_ = o.status_;
                if (o.engaged_) construct_(*o.get_());
                return *this;
            }

            Expected& operator=(Expected&& o) noexcept(std::is_nothrow_move_constructible_v<T>){
                if (this == &o) return *this;
                destroy_();
                status_ = o.status_;
                if (o.engaged_) construct_(std::move(*o.get_()));
                o.destroy_();
                return *this;
            }

            ~Expected() noexcept{
                destroy_();
            }

            [[nodiscard]] bool has_value() const noexcept{
                return engaged_;
            }

            [[nodiscard]] explicit operator bool() const noexcept{
                return engaged_;
            }

            [[nodiscard]] Status status() const noexcept{
                return engaged_ ? Status::kOK : status_;
            }

            // // unchecked access: call has_value() first
            [[nodiscard]] T& value() noexcept{
                return *get_();
            }

            [[nodiscard]] const T& value() const noexcept{
                return *get_();
            }

            // move the value out and leave the holder empty
            [[nodiscard]] T take() noexcept(std::is_nothrow_move_constructible_v<T>){
                T out = std::move(*get_());
                destroy_();
                return out;
            }

        private:
            alignas(T) unsigned char buf_[sizeof(T)]{};
            Status status_{Status::kOK};
            bool engaged_{false};

            Expected() = default;

            template <class ... Args>
            void construct_(Args&&... args){
                ::new (static_cast<void*>(buf_)) T(std::forward<Args>(args)...);
                engaged_ = true;
            }

            void destroy_() noexcept{
                if (engaged_){
                    get_()->~T();
                    engaged_ = false;
                }
            }

            T* get_() noexcept{
                return std::launder(reinterpret_cast<T*>(buf_));
            }

            const T* get_() const noexcept{
                return std::launder(reinterpret_cast<const T*>(buf_));
            }
    };
} // namespace faultscan
