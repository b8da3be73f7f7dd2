#pragma once

#include "libtune/search_space_types.hpp"
#include "libtune/transformer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace libtune {

class TransformerFactory {
public:
    // Stateful transformers ("onehot", "one-hot", "labels") are fitted on `categories`.
    static std::shared_ptr<const Transformer> create(const std::string& transformer_name,
                                                     const std::vector<Value>& categories = {});
};

}  // namespace libtune
