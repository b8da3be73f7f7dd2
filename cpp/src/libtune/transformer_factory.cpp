#include "libtune/transformer_factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace libtune {

std::shared_ptr<const Transformer> TransformerFactory::create(const std::string& transformer_name,
                                                              const std::vector<Value>& categories) {
    if (transformer_name == "identity") {
        return make_identity_transformer();
    }
    if (transformer_name == "log") {
        return make_log_transformer();
    }
    if (transformer_name == "log10") {
        return make_log10_transformer();
    }
    if (transformer_name == "onehot" || transformer_name == "one-hot") {
        return make_categorical_encoder(categories);
    }
    if (transformer_name == "labels") {
        return make_label_encoder(categories);
    }
    throw std::invalid_argument("Unknown transformer: " + transformer_name);
}

}  // namespace libtune
