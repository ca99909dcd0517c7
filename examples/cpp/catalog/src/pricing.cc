#include "pricing.hpp"

namespace catalog {

using namespace aspect;

int64_t ListPriceCalculator::quote(const examples::Product& product, int32_t quantity) {
    if (quantity <= 0) throw InvalidArgumentError("Quantity must be positive");
    return product.price_cents() * quantity;
}

std::shared_ptr<Interceptor> make_volume_discount(int32_t min_quantity, int32_t percent) {
    auto discount = std::make_shared<FunctionInterceptor>("volume_discount", 20);
    discount->on_transform([min_quantity, percent](MethodCallContext& ctx, std::any previous) {
        if (ctx.argument<int32_t>(1) < min_quantity) return previous;
        auto total = std::any_cast<int64_t>(previous);
        return std::any(total - total * percent / 100);
    });
    return discount;
}

}  // namespace catalog
