#include "vfs/VfsOptions.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace PV {

namespace {

constexpr char kDocTypeKey[]           = "doc_type";
constexpr char kChildrenPageSizeKey[]  = "children_page_size";
constexpr char kFanoutConcurrencyKey[] = "fanout_concurrency";
constexpr char kMaxNameLengthKey[]     = "max_name_length";

auto parse_size(std::string_view text, char const* name) -> Expected<std::size_t> {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);

    std::size_t value = 0;
    auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        return std::unexpected(Error{Error::Code::MalformedInput, std::string(name) + " is not a non-negative integer: '" + std::string(text) + "'"});
    return value;
}

auto read_size(nlohmann::json const& config, char const* key, std::size_t& out) -> std::optional<Error> {
    auto it = config.find(key);
    if (it == config.end())
        return std::nullopt;
    if (!it->is_number_unsigned())
        return Error{Error::Code::MalformedInput, std::string(key) + " must be a non-negative integer"};
    out = it->get<std::size_t>();
    return std::nullopt;
}

} // namespace

auto validateVfsOptions(VfsOptions const& options) -> std::optional<Error> {
    if (options.docType.empty())
        return Error{Error::Code::MalformedInput, "doc_type must not be empty"};
    if (options.childrenPageSize == 0)
        return Error{Error::Code::MalformedInput, "children_page_size must be at least 1"};
    if (options.fanoutConcurrency == 0)
        return Error{Error::Code::MalformedInput, "fanout_concurrency must be at least 1"};
    if (options.maxNameLength == 0)
        return Error{Error::Code::MalformedInput, "max_name_length must be at least 1"};
    return std::nullopt;
}

auto loadVfsOptionsFromJson(std::string_view text, VfsOptions base) -> Expected<VfsOptions> {
    auto config = nlohmann::json::parse(text, nullptr, false);
    if (config.is_discarded())
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid options JSON"});
    if (!config.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "options JSON must be an object"});

    if (auto it = config.find(kDocTypeKey); it != config.end()) {
        if (!it->is_string())
            return std::unexpected(Error{Error::Code::MalformedInput, "doc_type must be a string"});
        base.docType = it->get<std::string>();
    }
    if (auto error = read_size(config, kChildrenPageSizeKey, base.childrenPageSize))
        return std::unexpected(*error);
    if (auto error = read_size(config, kFanoutConcurrencyKey, base.fanoutConcurrency))
        return std::unexpected(*error);
    if (auto error = read_size(config, kMaxNameLengthKey, base.maxNameLength))
        return std::unexpected(*error);

    if (auto invalid = validateVfsOptions(base))
        return std::unexpected(*invalid);
    return base;
}

auto applyVfsOptionsEnvironment(VfsOptions base) -> Expected<VfsOptions> {
    if (char const* docType = std::getenv("PATHVAULT_DOC_TYPE"))
        base.docType = docType;

    struct SizeVar {
        char const*  name;
        std::size_t* field;
    };
    for (auto const& var : {SizeVar{"PATHVAULT_CHILDREN_PAGE_SIZE", &base.childrenPageSize},
                            SizeVar{"PATHVAULT_FANOUT_CONCURRENCY", &base.fanoutConcurrency},
                            SizeVar{"PATHVAULT_MAX_NAME_LENGTH", &base.maxNameLength}}) {
        char const* value = std::getenv(var.name);
        if (value == nullptr)
            continue;
        auto parsed = parse_size(value, var.name);
        if (!parsed)
            return std::unexpected(parsed.error());
        *var.field = *parsed;
    }

    if (auto invalid = validateVfsOptions(base))
        return std::unexpected(*invalid);
    return base;
}

auto vfsOptionsToJson(VfsOptions const& options) -> nlohmann::json {
    return nlohmann::json{
        {kDocTypeKey, options.docType},
        {kChildrenPageSizeKey, options.childrenPageSize},
        {kFanoutConcurrencyKey, options.fanoutConcurrency},
        {kMaxNameLengthKey, options.maxNameLength},
    };
}

} // namespace PV
