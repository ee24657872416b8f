#pragma once
#include <optional>
#include <string>


namespace trackerd::tracker {

    enum class Errc {
        unknown_action,
        unknown_announce_event,
        insufficient_bytes,
        io,
        config
    };

    const char* errcName(Errc code);

    struct Error {
    Errc code{Errc::io};
    std::string message;
    };


    template <typename T>
    struct Expected
    {
        std::optional<T> value;
        std::optional<Error> error;


        static Expected success(T v) {
            Expected e; e.value = std::move(v);
            return e;
        }
        static Expected failure(Errc code, std::string msg) {
            Expected e; e.error = Error{code, std::move(msg)};
            return e;
        }
        static Expected failure(Error err) {
            Expected e; e.error = std::move(err);
            return e;
        }
        bool has_value() const { return value.has_value(); }
        T& get() { return *value; }
        const T& get() const { return *value; }
    };


    template <>
    struct Expected<void>
    {
        std::optional<Error> error;
        static Expected success() { return {}; }
        static Expected failure(Errc code, std::string msg) { Expected e; e.error = Error{code, std::move(msg)}; return e; }
        static Expected failure(Error err) { Expected e; e.error = std::move(err); return e; }
        bool has_value() const { return !error.has_value(); }
    };


} // namespace trackerd::tracker
