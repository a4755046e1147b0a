#ifndef POCKET_FILES
#define POCKET_FILES

#include <Pocket/types.hpp>

namespace Pocket {

    void write_to_file (const std::string &, const std::string &filename);

    void inline write_to_file (const JSON &j, const std::string &filename) {
        write_to_file (j.dump (2, ' '), filename);
    }

    // returns null if the file does not exist.
    JSON read_from_file (const std::string &filename);

}

#endif
