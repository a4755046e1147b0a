#include "options.hpp"

#include <cstdlib>
#include <sstream>

std::string options::filepath () const {
    maybe<std::string> path;
    this->get ("file", path);
    if (bool (path)) return *path;

    const char *val = std::getenv ("POCKET_FILE");
    if (bool (val)) return std::string {val};

    return "pocket.json";
}

maybe<std::string> options::wallet () const {
    maybe<std::string> name;
    this->get ("wallet", name);
    return name;
}

maybe<std::string> options::sort () const {
    maybe<std::string> key;
    this->get ("sort", key);
    return key;
}

maybe<Pocket::timestamp> options::time (const std::string &name) const {
    maybe<std::string> x;
    this->get (name, x);
    if (!bool (x)) return {};

    maybe<Pocket::timestamp> t = Pocket::read_timestamp (*x);
    if (!bool (t)) throw data::exception {2} << "could not read " << name << " " << *x << "; expected YYYY-MM-DD or YYYY-MM-DD HH:MM:SS";
    return t;
}

namespace {

    std::set<std::string> read_list (const std::string &x) {
        std::set<std::string> result;
        std::stringstream ss {x};
        std::string item;
        while (std::getline (ss, item, ',')) if (!item.empty ()) result.insert (item);
        return result;
    }

    maybe<Pocket::date> read_day (const options &o, const std::string &name) {
        maybe<Pocket::timestamp> t = o.time (name);
        if (!bool (t)) return {};
        return {Pocket::day_of (*t)};
    }

}

Pocket::filtering_context options::filters () const {
    Pocket::filtering_context f;

    maybe<std::string> preset;
    this->get ("filter", preset);
    if (bool (preset)) {
        maybe<Pocket::filter_preset> p = Pocket::read_filter_preset (*preset);
        if (!bool (p)) throw data::exception {2} << "unknown filter " << *preset << "; use method filters to see the options";
        f.add (Pocket::make_filter (*p));
    }

    maybe<Pocket::date> from = read_day (*this, "from");
    maybe<Pocket::date> to = read_day (*this, "to");
    if (bool (from) || bool (to))
        f.add (std::make_shared<Pocket::date_filter> (Pocket::date_filter::between (from, to)));

    maybe<std::string> category;
    this->get ("category", category);
    if (bool (category)) f.add (std::make_shared<Pocket::category_filter> (read_list (*category)));

    maybe<std::string> excluded;
    this->get ("exclude_category", excluded);
    if (bool (excluded)) f.add (std::make_shared<Pocket::category_filter> (read_list (*excluded), true));

    maybe<double> min;
    maybe<double> max;
    this->get ("min", min);
    this->get ("max", max);
    if (bool (min) || bool (max)) f.add (std::make_shared<Pocket::amount_filter> (min, max));

    maybe<std::string> search;
    this->get ("search", search);
    if (bool (search)) f.add (std::make_shared<Pocket::description_filter> (*search, this->has ("case_sensitive")));

    return f;
}
