#include <Pocket/files.hpp>
#include <filesystem>
#include <fstream>

namespace Pocket {

    void write_to_file (const std::string &x, const std::string &filename) {
        std::fstream file;
        file.open (filename, std::ios::out);
        if (!file) throw exception {} << "could not open file " << filename;
        file << x;
        file.close ();
    }

    JSON read_from_file (const std::string &filename) {
        std::filesystem::path p {filename};
        if (!std::filesystem::exists (p)) return JSON (nullptr);

        std::ifstream fi;
        fi.open (filename, std::ios::in);
        if (!fi) throw exception {} << "could not open file " << filename;

        try {
            return JSON::parse (fi);
        } catch (const JSON::parse_error &x) {
            throw exception {} << "invalid file format in " << filename << ": " << x.what ();
        }
    }

}
