#ifndef SBIND_LIB_UTIL_UTIL_H_
#define SBIND_LIB_UTIL_UTIL_H_

#include <string>
#include <string_view>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <vector>

namespace util {

template<class... Ts>
struct overloaded : Ts ... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)
#define AT __FILE__ ":" TOSTRING(__LINE__)
#define THROW_INTERNAL_ERROR throw std::runtime_error( AT ": internal_error" );
#define THROW_INVARIANT_VIOLATION(what) throw std::runtime_error( std::string(AT ": invariant violation: ") + (what) );

#endif //SBIND_LIB_UTIL_UTIL_H_
