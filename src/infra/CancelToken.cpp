#include "clearhouse/infra/CancelToken.hpp"

#include "clearhouse/domain/Errors.hpp"

namespace clearhouse::infra {

void CancelToken::check(const char* where) const {
    if (cancelled()) throw Cancelled(where);
}

} // namespace clearhouse::infra
