#ifndef POCKET_CLI_OPTIONS
#define POCKET_CLI_OPTIONS

#include <Pocket/filter.hpp>
#include <data/io/arg_parser.hpp>

using arg_parser = data::io::arg_parser;
using namespace data;

// command line options, with environment variables as a fallback.
struct options : arg_parser {
    options (arg_parser &&ap) : arg_parser {ap} {}

    // --file, else POCKET_FILE, else pocket.json in the working directory.
    std::string filepath () const;

    // the wallet to act on, if not the current wallet.
    maybe<std::string> wallet () const;

    maybe<std::string> sort () const;

    // build the filters given by --filter, --from, --to, --category, --exclude_category,
    // --min, --max and --search. Throws exception if any of them cannot be read.
    Pocket::filtering_context filters () const;

    // read a time given as an option. Throws exception if it cannot be read.
    maybe<Pocket::timestamp> time (const std::string &name) const;
};

#endif
