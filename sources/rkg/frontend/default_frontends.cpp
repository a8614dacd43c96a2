#include "rkg/frontend/frontend.hpp"

#ifdef RKG_WITH_TREE_SITTER
#include "rkg/frontend/typescript_frontend.hpp"
#endif

namespace rkg::frontend {

    FrontendRegistry default_frontends() {
        FrontendRegistry registry;
#ifdef RKG_WITH_TREE_SITTER
        registry.register_frontend(std::make_shared<TypeScriptFrontend>());
#endif
        return registry;
    }

}  // namespace rkg::frontend
