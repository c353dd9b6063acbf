/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#include <algorithm>
#include "ProcessRegistry.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    // -------------------------------------------------------------------------
    bool ProcessRegistry::add( const Item& mp )
    {
        if( !mp )
            return false;

        std::lock_guard<std::mutex> lock(mutex_);

        for( const auto& i : items_ )
        {
            if( i->spec.name == mp->spec.name || i->spec.port == mp->spec.port )
                return false;
        }

        items_.push_back(mp);
        return true;
    }
    // -------------------------------------------------------------------------
    bool ProcessRegistry::remove( const Item& mp )
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = std::find(items_.begin(), items_.end(), mp);

        if( it == items_.end() )
            return false;

        items_.erase(it);
        return true;
    }
    // -------------------------------------------------------------------------
    std::vector<ProcessRegistry::Item> ProcessRegistry::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_;
    }
    // -------------------------------------------------------------------------
    std::vector<ProcessRegistry::Item> ProcessRegistry::reverseSnapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<Item>(items_.rbegin(), items_.rend());
    }
    // -------------------------------------------------------------------------
    ProcessRegistry::Item ProcessRegistry::find( const std::string& name ) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for( const auto& i : items_ )
        {
            if( i->spec.name == name )
                return i;
        }

        return nullptr;
    }
    // -------------------------------------------------------------------------
    ProcessRegistry::Item ProcessRegistry::findByPort( int port ) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for( const auto& i : items_ )
        {
            if( i->spec.port == port )
                return i;
        }

        return nullptr;
    }
    // -------------------------------------------------------------------------
    size_t ProcessRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }
    // -------------------------------------------------------------------------
    bool ProcessRegistry::empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }
    // -------------------------------------------------------------------------
} // end of namespace devvisor
// -------------------------------------------------------------------------
