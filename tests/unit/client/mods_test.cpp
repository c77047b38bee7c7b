#include <gtest/gtest.h>

#include <fleet/client/mods.h>
#include <fleet/common/recordset_compat.h>

#include "common/test_helpers.h"

namespace fleet::client::test {

using fleet::tests::makeMessage;
using fleet::tests::makeParameters;

TEST(BuiltinModsTest, ParametersSizeModCountsOutboundArrays) {
    ClientAppCallable app = [](Message& msg, Context&) -> Result<Message> {
        GetParametersRes res{Status{}, makeParameters({"1234", "56"})};
        return Message(msg.metadata(), compat::toRecordSet(res));
    };
    auto wrapped = make_ffn(app, {mods::parametersSizeMod});
    ASSERT_TRUE(wrapped);

    Context context;
    auto message = makeMessage("get-parameters");
    auto out = wrapped.value()(message, context);
    ASSERT_TRUE(out);

    const auto* sizes = out.value().content().findMetrics(mods::kParametersSizeRecord);
    ASSERT_NE(sizes, nullptr);
    EXPECT_EQ(std::get<int64_t>(*sizes->find("arrays")), 2);
    EXPECT_EQ(std::get<int64_t>(*sizes->find("bytes")), 6);

    // The response still decodes; the extra record does not disturb the codec.
    auto decoded = compat::fromRecordSet<GetParametersRes>(out.value().content());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().parameters.tensors.size(), 2u);
}

TEST(BuiltinModsTest, ParametersSizeModLeavesErrorsAlone) {
    ClientAppCallable app = [](Message&, Context&) -> Result<Message> {
        return Error{ErrorCode::SchemaMismatch, "bad"};
    };
    auto wrapped = make_ffn(app, {mods::parametersSizeMod});
    ASSERT_TRUE(wrapped);

    Context context;
    auto message = makeMessage("fit");
    auto out = wrapped.value()(message, context);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, ErrorCode::SchemaMismatch);
}

TEST(BuiltinModsTest, MessageSizeModPassesThrough) {
    bool called = false;
    ClientAppCallable app = [&called](Message& msg, Context&) -> Result<Message> {
        called = true;
        return Message(msg.metadata(), msg.content());
    };
    auto wrapped = make_ffn(app, {mods::messageSizeMod});
    ASSERT_TRUE(wrapped);

    Context context;
    RecordSet content;
    content.setConfigs("cfg", ConfigsRecord{{"k", int64_t{1}}});
    auto message = makeMessage("get-properties", content);
    auto out = wrapped.value()(message, context);
    ASSERT_TRUE(out);
    EXPECT_TRUE(called);
    EXPECT_EQ(out.value().content(), content);
}

} // namespace fleet::client::test
