/**
 * Ferry - Turns cp and mirror arguments into the ordered TransferItem sequence of a session.
 */
#pragma once

#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "ferry/client_factory.hpp"
#include "ferry/session.hpp"
#include "ferry/url.hpp"

namespace ferry
{

    using ItemSink = std::function<void(const TransferItem &)>;

    // Called for every source entry that cannot be turned into an item. Preparation goes on.
    using PrepareErrorSink = std::function<void(const std::string &url, std::exception_ptr error)>;

    // cp SOURCE... TARGET. Every item has target index 0.
    void prepare_copy(const std::vector<ResolvedUrl> &sources, const ResolvedUrl &target, const ClientFactory &factory,
                      const ItemSink &sink, const PrepareErrorSink &on_error);

    // mirror SOURCE TARGET... Items come out source-major: all items for one source key are adjacent, in target order.
    // Keys that differ in size are only copied with force.
    void prepare_mirror(const ResolvedUrl &source, const std::vector<ResolvedUrl> &targets, bool force,
                        const ClientFactory &factory, const ItemSink &sink, const PrepareErrorSink &on_error);

} // namespace ferry
