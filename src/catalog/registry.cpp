#include "catalog/registry.hpp"
#include "catalog/bestiary.hpp"
#include "catalog/party.hpp"
#include <mutex>

namespace d20 {

// Days may be simulated from several threads at once; the first caller fills
// the registry and the others wait for it.
void initialize_catalog() {
    static std::once_flag once;
    std::call_once(once, [] {
        auto& registry = get_combatant_registry();
        register_party(registry);
        register_bestiary(registry);
        registry.set_initialized(true);
    });
}

} // namespace d20
