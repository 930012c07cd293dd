#include <featureprobe/api.hpp>

namespace fp {

const char *
version()
{
    return FP_SDK_VERSION;
}

} // namespace fp
