#pragma once
#include <optional>
#include <string>


namespace metacat::link {

    enum class ErrorCode { malformedAddress, ambiguousAddress, invalidSegmentOrder };

    const char* toString(ErrorCode code);

    struct Error {
    ErrorCode code{ErrorCode::malformedAddress};
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
        static Expected failure(ErrorCode code, std::string msg) { 
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


} // namespace metacat::link
