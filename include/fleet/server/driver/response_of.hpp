// Mapping from instruction types to their result types.
#pragma once

#include <fleet/common/typing.h>

namespace fleet::server {

template <typename Ins> struct ResponseOf; // primary template left undefined to force specializations

template <> struct ResponseOf<GetPropertiesIns> {
    using type = GetPropertiesRes;
};
template <> struct ResponseOf<GetParametersIns> {
    using type = GetParametersRes;
};
template <> struct ResponseOf<FitIns> {
    using type = FitRes;
};
template <> struct ResponseOf<EvaluateIns> {
    using type = EvaluateRes;
};

template <typename Ins> using ResponseOfT = typename ResponseOf<Ins>::type;

} // namespace fleet::server
