#include <dispatcher/version.hpp>

namespace dispatcher
{

std::string version_string()
{
    return VERSION_STRING;
}

} // namespace dispatcher
