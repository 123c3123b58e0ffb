#pragma once
#include <string>
#include <string_view>

namespace sg {

// Percent-decode a URI component. Malformed escapes or non-UTF-8 output
// leave the input unchanged.
std::string decode_component(std::string_view text);

// Percent-encode a URL, keeping escapes that are already valid. A '%' that
// starts a broken escape is encoded together with the one or two bytes it
// would have covered ("%%41" -> "%25%2541", "%G[" -> "%25G[", "%4[" ->
// "%254%5B"); brackets in those bytes are escaped too.
std::string encode_url(std::string_view url);

}
