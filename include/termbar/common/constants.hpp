#pragma once

#include <string>
#include <cstddef>

namespace termbar {
namespace constants {

namespace version {
    constexpr const char* LIBRARY_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("termbar v") + LIBRARY_VERSION;
    }
}

namespace label {
    constexpr std::size_t FIELD_WIDTH = 40;
    constexpr std::size_t HEAD_CHARS = 19;
    constexpr const char* ELLIPSIS = "...";
    constexpr std::size_t TAIL_CHARS = 18;
    constexpr std::size_t CENTER_WIDTH = 20;
}

namespace ansi {
    constexpr const char* CARRIAGE_RETURN = "\r";
    constexpr const char* TRACK_COLOR = "\033[31m";
    constexpr const char* NORMAL_COLOR = "\033[37m\033[22m";
    constexpr const char* FILL_COLOR = "\033[32m\033[1m";
    constexpr const char* SAVE_CURSOR = "\033[s";
    constexpr const char* RESTORE_CURSOR = "\033[u";
    constexpr const char* CLEAR_TO_EOL = "\033[K";

    inline std::string cursorToRow(int row) {
        return "\033[" + std::to_string(row) + "H";
    }
}

namespace bar {
    constexpr const char* LABEL_PREFIX = " ";
    constexpr const char* OPEN = " |";
    constexpr const char* CLOSE = "| ";
    constexpr const char* READOUT_SEPARATOR = " of ";
}

namespace logging {
    constexpr const char* LOGGER_NAME = "termbar";
    constexpr std::size_t DEFAULT_ROTATION_SIZE_MB = 10;
    constexpr std::size_t DEFAULT_MAX_FILES = 3;
}

}
}
