/*
 * account.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Account collaborator that owns the authoritative inventory

**************************************************/

#ifndef SWEEPLINK_INVENTORY_ACCOUNT_HPP
#define SWEEPLINK_INVENTORY_ACCOUNT_HPP

#include "types.hpp"

namespace sweeplink::inventory {

/**
 * @brief Fetches the device inventory of the signed-in account
 */
class AccountClient {
public:
    virtual ~AccountClient() = default;

    /**
     * @brief Fetch the current inventory
     * @throws AuthenticationFailure when the credentials are rejected
     * @throws ConnectivityFailure when the account service is unreachable
     */
    virtual auto fetchInventory() -> InventorySnapshot = 0;
};

}  // namespace sweeplink::inventory

#endif  // SWEEPLINK_INVENTORY_ACCOUNT_HPP
