#include <swfcoord/version.h>

namespace swfcoord {

const char* version() noexcept { return SWFCOORD_VERSION_STRING; }

} // namespace swfcoord
