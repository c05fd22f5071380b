/// @file extension_module.cpp
/// @brief Extension module variant group implementation

#include <pyembed/packaging/extension_module.hpp>
#include <stdexcept>
#include <utility>

namespace pyembed_packaging {

std::string PythonExtensionModule::display_name() const {
    if (variant.has_value()) {
        return name + "[" + *variant + "]";
    }
    return name;
}

void PythonExtensionModuleVariants::push(PythonExtensionModule em) {
    m_variants.push_back(std::move(em));
}

const PythonExtensionModule& PythonExtensionModuleVariants::default_variant() const {
    if (m_variants.empty()) {
        throw std::out_of_range("extension module variant group is empty");
    }
    return m_variants.front();
}

const PythonExtensionModule& PythonExtensionModuleVariants::choose_variant(
    const std::map<std::string, std::string>& preferred) const {

    const PythonExtensionModule& fallback = default_variant();

    auto it = preferred.find(fallback.name);
    if (it == preferred.end()) {
        return fallback;
    }

    for (const auto& em : m_variants) {
        if (em.variant.has_value() && *em.variant == it->second) {
            return em;
        }
    }

    return fallback;
}

} // namespace pyembed_packaging
