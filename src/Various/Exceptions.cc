/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include "Exceptions.h"
// -------------------------------------------------------------------------
std::string devvisor::to_string( LaunchError::Kind k )
{
    switch( k )
    {
        case LaunchError::NotFound:
            return "not-found";

        case LaunchError::SpawnFailed:
            return "spawn-failed";

        case LaunchError::Duplicate:
            return "duplicate";
    }

    return "unknown";
}
// -------------------------------------------------------------------------
