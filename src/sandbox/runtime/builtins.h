//
// NLytics Sandbox Builtins
//
// The restricted builtin table. Every name a program can reach without an
// import is installed here: the safe builtins, stubs for the dynamic and
// introspection primitives, and the configured module aliases.
//

#pragma once

#include "execution_context.h"

namespace nlytics::sandbox
{
    void InstallBuiltins(ExecutionContext& context);

} // namespace nlytics::sandbox
