/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 */
// -------------------------------------------------------------------------
#ifndef ProcessRegistry_H_
#define ProcessRegistry_H_
// -------------------------------------------------------------------------
#include <memory>
#include <mutex>
#include <vector>
#include <string>
#include "ServiceInfo.h"
// -------------------------------------------------------------------------
namespace devvisor
{
    /*!
     * Ordered set of running managed processes (insertion order = startup order).
     * Shared by the launcher, the liveness monitor and the shutdown coordinator.
     * Every method takes the internal lock; no method blocks while holding it.
     */
    class ProcessRegistry
    {
        public:
            typedef std::shared_ptr<ManagedProcess> Item;

            ProcessRegistry() = default;

            /*! \return false if an entry with the same name or port is already registered */
            bool add( const Item& mp );

            /*! \return false if the entry is not registered (already removed) */
            bool remove( const Item& mp );

            //! copy of the entries in startup order
            std::vector<Item> snapshot() const;

            //! copy of the entries in reverse startup order
            std::vector<Item> reverseSnapshot() const;

            Item find( const std::string& name ) const;
            Item findByPort( int port ) const;

            size_t size() const;
            bool empty() const;

        private:
            mutable std::mutex mutex_;
            std::vector<Item> items_;
    };

} // end of namespace devvisor
// -------------------------------------------------------------------------
#endif // ProcessRegistry_H_
// -------------------------------------------------------------------------
