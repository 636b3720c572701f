#include "greet.h"

#include <cctype>
#include <string>

extern "C" const char *shout(void) {
    static std::string loud;
    loud = greeting();
    for (auto &c : loud)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return loud.c_str();
}
