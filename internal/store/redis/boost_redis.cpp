// Boost.Redis compiles its implementation into exactly one translation unit.
#include <boost/redis/src.hpp>
