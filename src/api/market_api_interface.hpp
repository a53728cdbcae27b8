#ifndef MARKET_API_INTERFACE_HPP
#define MARKET_API_INTERFACE_HPP

namespace BeanTrader {
namespace API {

/**
 * Remote market operations. Each call issues exactly one request and throws
 * RequestError / RateLimitError on failure.
 */
class MarketApiInterface {
public:
    virtual ~MarketApiInterface() = default;

    virtual long long fetch_price() = 0;
    virtual long long fetch_owned_units() = 0;
    virtual long long fetch_balance() = 0;

    virtual void submit_buy(long long units) = 0;
    virtual void submit_sell(long long units) = 0;
};

} // namespace API
} // namespace BeanTrader

#endif // MARKET_API_INTERFACE_HPP
