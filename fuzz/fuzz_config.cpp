#include <string>
#include <cstddef>
#include <cstdint>

#include "config.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return 0;
    }

    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto cfg = nett::parse_config_text(input);
    if (cfg)
    {
        const auto reparsed = nett::parse_config_text(nett::dump_config(*cfg));
        if (!reparsed)
        {
            __builtin_trap();
        }
    }

    return 0;
}
