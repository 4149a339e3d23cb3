#include <cctype>
#include <cstdio>
#include <cstdlib>

#include <map>
#include <mutex>
#include <string>
#include <sstream>
#include <stdexcept>
#include <typeinfo>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "params.h"
#include "macros.h"
#include "verbose.h"

static std::mutex mutex;

struct param_list_impl {
    // documented parameters
    std::string usage_header;
    struct collate {
        /* - and _ compare equal, except as the first character */
        bool operator()(std::string const & a, std::string const & b) const {
            size_t k;
            for(k = 0 ; k < a.size() && k < b.size() ; k++) {
                int r = (a[k] > b[k]) - (b[k] > a[k]);
                if (k && (a[k] == '-' || a[k] == '_') && (b[k] == '-' || b[k] == '_')) r = 0;
                if (r) return r < 0;
            }
            return a.size() < b.size();
        }
    };
    std::map<std::string, std::string, collate> documentation;   /* for each key */
    struct parameter {
        std::string value;
        enum parameter_origin origin;
        bool parsed;
        explicit parameter(std::string value = std::string(),
                enum parameter_origin origin = PARAMETER_FROM_FILE,
                bool parsed = false)
            : value(std::move(value))
            , origin(origin)
            , parsed(parsed) {}
    };
    std::map<std::string, parameter, collate> p;
    // aliases
    std::map<std::string, std::string, collate> aliases;
    // switches
    std::map<std::string, int *, collate> switches;
    /* the first argv seen, for param_list_print_command_line */
    int cmdline_argc0 = 0;
    char const ** cmdline_argv0 = nullptr;
    // once a key is documented, undocumented keys get a warning
    bool use_doc = false;
};

static param_list_impl & impl(param_list_ptr pl)
{
    return *static_cast<param_list_impl *>(pl->pimpl);
}

static param_list_impl const & impl(param_list_srcptr pl)
{
    return *static_cast<param_list_impl const *>(pl->pimpl);
}

void param_list_init(param_list_ptr pl)
{
    pl->pimpl = new param_list_impl();
}

void param_list_clear(param_list_ptr pl)
{
    delete static_cast<param_list_impl *>(pl->pimpl);
}

void param_list_usage_header(param_list_ptr pl, const char * hdr)
{
    impl(pl).usage_header = hdr;
}

void param_list_decl_usage(param_list_ptr pl, const char * key, const char * doc)
{
    auto & pli = impl(pl);
    pli.documentation[key] = doc;
    pli.use_doc = true;
}

static bool is_documented_key(param_list_impl const & pli, std::string const & key)
{
    return pli.documentation.find(key) != pli.documentation.end();
}

void param_list_print_usage(param_list_srcptr pl, const char * argv0, FILE *f)
{
    auto const & pli = impl(pl);

    if (argv0 != nullptr)
        fprintf(f, "Usage: %s <parameters>\n", argv0);

    if (!pli.usage_header.empty())
        fputs(pli.usage_header.c_str(), f);

    fprintf(f, "The available parameters are the following:\n");

    /* a copy, which gets the switch and alias annotations */
    auto full_doc = pli.documentation;

    for(auto const & s : pli.switches) {
        std::string & v = full_doc[s.first];
        v = fmt::format("(switch) {}", v.empty() ? "UNDOCUMENTED" : v);
    }

    for(auto const & a : pli.aliases) {
        std::string & v = full_doc[a.second];
        v = fmt::format("(alias -{}) {}", a.first, v.empty() ? "UNDOCUMENTED" : v);
    }

    for(auto const & d : full_doc)
        fprintf(f, "    -%-*s %s\n", 20, d.first.c_str(), d.second.c_str());
}

/* A value given on the command line takes precedence over one from a
 * file, whatever the order in which they are seen. */
static void param_list_add_key(param_list_impl & pli,
        std::string const & key,
        std::string const & value,
        enum parameter_origin origin)
{
    param_list_impl::parameter p { value, origin };

    if (pli.switches.find(key) != pli.switches.end())
        p.parsed = true;

    auto it = pli.p.find(key);
    if (it != pli.p.end() && it->second.origin > origin)
        return;
    pli.p[key] = p;
}

static std::string trim(std::string const & s)
{
    auto const b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::string();
    auto const e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e + 1 - b);
}

/* Lines are key=value, key:value or key:=value, and # starts a comment.
 * Malformed lines are reported and make the return value 0, but the
 * rest of the file is still read. */
static int param_list_read_stream(param_list_impl & pli, FILE *f)
{
    int all_ok = 1;
    char buf[2048];
    for(unsigned int lineno = 1 ; fgets(buf, sizeof(buf), f) != nullptr ; lineno++) {
        std::string line = buf;
        auto const hash = line.find('#');
        if (hash != std::string::npos)
            line.erase(hash);
        line = trim(line);
        if (line.empty())
            continue;

        size_t l = 0;
        for( ; l < line.size() && (isalnum((int)(unsigned char)line[l]) || line[l] == '_' || line[l] == '-') ; l++);
        if (l == 0) {
            fmt::print(stderr, "Parse error, no usable key on line {}: {}\n", lineno, line);
            all_ok = 0;
            continue;
        }

        std::string const key = line.substr(0, l);
        std::string rest = trim(line.substr(l));
        if (rest.compare(0, 2, ":=") == 0) {
            rest.erase(0, 2);
        } else if (!rest.empty() && (rest[0] == '=' || rest[0] == ':')) {
            rest.erase(0, 1);
        } else {
            fmt::print(stderr, "Parse error, no separator on line {}: {}\n", lineno, line);
            all_ok = 0;
            continue;
        }

        param_list_add_key(pli, key, trim(rest), PARAMETER_FROM_FILE);
    }
    return all_ok;
}

int param_list_read_file(param_list_ptr pl, const char * name)
{
    FILE * f = fopen(name, "r");
    if (f == nullptr)
        throw parameter_error(fmt::format("Cannot read {}", name));
    int const r = param_list_read_stream(impl(pl), f);
    fclose(f);
    return r;
}

static const char * skip_leading_dashes(const char * s)
{
    for(int i = 0 ; i < 2 && *s == '-' ; s++, i++) ;
    return s;
}

int param_list_configure_alias(param_list_ptr pl, const char * key, const char * alias)
{
    auto & pli = impl(pl);
    ASSERT_ALWAYS(alias != nullptr);
    ASSERT_ALWAYS(key != nullptr);
    key = skip_leading_dashes(key);
    alias = skip_leading_dashes(alias);

    if (pli.use_doc && !is_documented_key(pli, key))
        fmt::print(stderr, "# Warning: an alias {} is declared to the key {}, which is undocumented\n", alias, key);

    pli.aliases[alias] = key;
    return 0;
}

int param_list_configure_switch(param_list_ptr pl, const char * switchname, int * ptr)
{
    auto & pli = impl(pl);
    switchname = skip_leading_dashes(switchname);

    if (pli.use_doc && !is_documented_key(pli, switchname))
        fmt::print(stderr, "# Warning: a switch {} is declared but is undocumented\n", switchname);

    pli.switches[switchname] = ptr;
    return 0;
}

int param_list_update_cmdline(param_list_ptr pl,
        int * p_argc, char const *** p_argv)
{
    auto & pli = impl(pl);
    ASSERT_ALWAYS(*p_argv != nullptr);
    if (!pli.cmdline_argv0) {
        pli.cmdline_argv0 = (*p_argv)-1;
        pli.cmdline_argc0 = (*p_argc)+1;
    }
    if (*p_argc == 0)
        return 0;

    const char * arg = (*p_argv)[0];
    bool const has_dashes = *arg == '-';
    std::string key = skip_leading_dashes(arg);
    std::string rhs;
    bool has_rhs = false;
    auto const eq = key.find('=');
    if (eq != std::string::npos) {
        rhs = key.substr(eq + 1);
        key.erase(eq);
        has_rhs = true;
    }

    bool negate = false;
    if (has_dashes && (key.compare(0, 3, "no-") == 0 || key.compare(0, 3, "no_") == 0)) {
        key.erase(0, 3);
        negate = true;
        if (has_rhs)
            return 0;
    }

    {
        auto const it = pli.aliases.find(key);
        if (it != pli.aliases.end())
            key = it->second;
    }

    auto const it = pli.switches.find(key);
    if (it != pli.switches.end()) {
        /* a switch with a nullptr pointer is only recorded */
        if (it->second) {
            if (negate) {
                *it->second = 0;
            } else if (!has_rhs) {
                ++*it->second;
            } else {
                size_t pos;
                int v;
                try {
                    v = std::stoi(rhs, &pos);
                } catch (std::logic_error const &) {
                    return 0;
                }
                if (pos != rhs.size())
                    return 0;
                *it->second = v;
            }
        }
        param_list_add_key(pli, key, std::string(), PARAMETER_FROM_CMDLINE);
        (*p_argv)++;
        (*p_argc)--;
        return 1;
    }

    if (negate)
        return 0;

    /* -key value and --key value take the next word; key=value does not */
    if (has_dashes && !has_rhs) {
        if (*p_argc < 2)
            return 0;
        rhs = (*p_argv)[1];
        has_rhs = true;
        (*p_argv)++;
        (*p_argc)--;
    }

    if (has_rhs) {
        param_list_add_key(pli, key, rhs, PARAMETER_FROM_CMDLINE);
        (*p_argv)++;
        (*p_argc)--;
        return 1;
    }
    return 0;
}

/* Look up an entry, and mark it as parsed. Look-ups are serialized. */
static bool get_assoc(param_list_ptr pl, std::string const & key0, std::string & value)
{
    std::string const key = skip_leading_dashes(key0.c_str());
    auto & pli = impl(pl);
    std::lock_guard<std::mutex> const dummy(mutex);
    if (pli.use_doc && !is_documented_key(pli, key))
        fmt::print(stderr, "# Warning: parameter {} is checked by this program but is undocumented.\n", key);
    auto it = pli.p.find(key);
    if (it == pli.p.end())
        return false;
    it->second.parsed = true;
    value = it->second.value;
    return true;
}

/* the full string must match */
template<typename T> struct parse {
    bool operator()(std::string const & s, T & value) const
    {
        std::istringstream ss(s);
        return ss >> value && ss.eof();
    }
};

template<> struct parse<unsigned long> {
    bool operator()(std::string const & s, unsigned long & value) const
    {
        /* istream happily wraps negative numbers */
        if (s.empty() || s[0] == '-')
            return false;
        std::istringstream ss(s);
        return ss >> value && ss.eof();
    }
};

template<> struct parse<std::string> {
    bool operator()(std::string const & s, std::string & value) const
    {
        value = s;
        return true;
    }
};

/* comma-separated lists; an empty string is an empty list */
template<typename T>
struct parse<std::vector<T>> {
    bool operator()(std::string const & s, std::vector<T> & value) const
    {
        value.clear();
        for(size_t pos0 = 0 ; pos0 < s.size() ; ) {
            size_t pos = s.find(',', pos0);
            if (pos == std::string::npos)
                pos = s.size();
            T v;
            if (!parse<T>()(s.substr(pos0, pos - pos0), v))
                return false;
            value.push_back(v);
            pos0 = pos + 1;
        }
        return true;
    }
};

template<typename T>
int
param_list_parse(param_list_ptr pl, std::string const & key, T & r)
{
    std::string value;
    if (!get_assoc(pl, key, value))
        return 0;
    if (parse<T>()(value, r))
        return 1;
    throw parameter_error(fmt::format("cannot cast parameter {} (\"{}\") to type {}",
                key, value, typeid(T).name()));
}

template int param_list_parse<unsigned long>(param_list_ptr pl, std::string const & key, unsigned long & r);
template int param_list_parse<std::string>(param_list_ptr pl, std::string const & key, std::string & r);
template int param_list_parse<std::vector<int>>(param_list_ptr pl, std::string const & key, std::vector<int> & r);
template int param_list_parse<std::vector<std::string>>(param_list_ptr pl, std::string const & key, std::vector<std::string> & r);

int param_list_warn_unused(param_list_srcptr pl)
{
    int u = 0;
    for(auto const & p : impl(pl).p) {
        if (!p.second.parsed && p.second.origin != PARAMETER_FROM_FILE) {
            fmt::print(stderr, "Warning: unused command-line parameter {}\n", p.first);
            u++;
        }
    }
    return u;
}

void param_list_print_command_line(FILE * stream, param_list_srcptr pl)
{
    auto const & pli = impl(pl);
    if (!pli.cmdline_argv0)
        return;

    if (verbose_enabled(BTRI_VERBOSE_PRINT_CMDLINE)) {
        fprintf(stream, "# %s", pli.cmdline_argv0[0]);
        for (int i = 1; i < pli.cmdline_argc0; i++)
            fprintf(stream, " %s", pli.cmdline_argv0[i]);
        fprintf(stream, "\n");
    }
    if (verbose_enabled(BTRI_VERBOSE_PRINT_COMPILATION_INFO)) {
#ifdef  __GNUC__
        fprintf(stream, "# Compiled with gcc " __VERSION__ "\n");
#endif
        fprintf(stream, "# Compiled for C++ standard %ld\n", (long) __cplusplus);
    }
}

void param_list_generic_failure(param_list_srcptr pl, const char *missing)
{
    auto const & pli = impl(pl);
    if (missing)
        fmt::print(stderr, "\nError: missing or invalid parameter \"-{}\"\n", missing);
    param_list_print_usage(pl, pli.cmdline_argv0 ? pli.cmdline_argv0[0] : nullptr, stderr);
    exit(EXIT_FAILURE);
}
