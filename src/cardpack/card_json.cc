#include "cardpack/card_json.h"

namespace cardpack {

bool
parse_card_json(std::string_view text, CardJson* out)
{
    if (!out) {
        return false;
    }
    CardJson doc = CardJson::parse(text.begin(), text.end(), nullptr,
                                   /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return false;
    }
    *out = std::move(doc);
    return true;
}


std::string
dump_card_json(const CardJson& doc)
{
    return doc.dump(-1, ' ', false, CardJson::error_handler_t::replace);
}


std::string
minify_json(std::string_view text)
{
    CardJson doc;
    if (!parse_card_json(text, &doc)) {
        return std::string(text);
    }
    return dump_card_json(doc);
}

}  // namespace cardpack
