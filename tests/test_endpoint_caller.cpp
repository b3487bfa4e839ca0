#include <gtest/gtest.h>

#include "api/decoders.hpp"
#include "api/requests.hpp"
#include "endpoint_caller.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace ollama_client;
using fakes::FakeTransport;
using fakes::Lines;
using fakes::ScriptedResponse;

class EndpointCallerTest : public ::testing::Test {
protected:
    EndpointCaller MakeCaller(std::shared_ptr<FakeTransport> transport, std::optional<BasicAuth> auth = std::nullopt) {
        EndpointDescriptor d;
        d.path = "/api/generate";
        d.basic_auth = std::move(auth);
        d.verbose = false;
        return EndpointCaller(d, std::move(transport), std::make_shared<JsonCodec>(),
                              std::make_shared<GenerateResponseDecoder>());
    }

    GenerateRequest MakeRequest() {
        GenerateRequest req;
        req.model = "llama2";
        req.prompt = "why is the sky blue?";
        req.stream = true;
        return req;
    }
};

TEST_F(EndpointCallerTest, ConcatenatesFragmentsAndStopsAtDone) {
    auto transport = std::make_shared<FakeTransport>(Lines(200, {
        R"({"response":"The ","done":false})",
        R"({"response":"sky ","done":false})",
        R"({"response":"scatters.","done":false})",
        R"({"response":"","done":true})",
        R"({"response":"ignored","done":false})",
        R"({"response":"ignored too","done":false})",
    }));
    auto caller = MakeCaller(transport);

    auto result = caller.CallSync(MakeRequest());

    EXPECT_EQ(result.response, "The sky scatters.");
    EXPECT_EQ(result.http_status_code, 200);
    EXPECT_GE(result.response_time_ms, 0);
    EXPECT_EQ(transport->stats().chunks_delivered.load(), 4);
}

TEST_F(EndpointCallerTest, ResultIsTrimmed) {
    auto transport = std::make_shared<FakeTransport>(Lines(200, {
        R"({"response":"  padded ","done":false})",
        R"({"response":"\n","done":true})",
    }));
    auto result = MakeCaller(transport).CallSync(MakeRequest());
    EXPECT_EQ(result.response, "padded");
}

TEST_F(EndpointCallerTest, NotFoundRaisesProtocolError) {
    auto transport = std::make_shared<FakeTransport>(Lines(404, {R"({"error":"model 'x' not found"})"}));
    auto caller = MakeCaller(transport);
    try {
        caller.CallSync(MakeRequest());
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_NE(std::string(e.what()).find("not found"), std::string::npos);
        EXPECT_EQ(e.status(), 404);
    }
}

TEST_F(EndpointCallerTest, NotFoundWithoutErrorKeyStillHasMessage) {
    auto transport = std::make_shared<FakeTransport>(Lines(404, {R"({"detail":"no such route"})"}));
    try {
        MakeCaller(transport).CallSync(MakeRequest());
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_STREQ(e.what(), R"({"detail":"no such route"})");
        EXPECT_EQ(e.status(), 404);
    }
}

TEST_F(EndpointCallerTest, UnauthorizedMessageIsFixed) {
    for (const auto& body : std::vector<std::vector<std::string>>{{}, {R"({"error":"token expired"})"}, {"<html>401</html>"}}) {
        auto transport = std::make_shared<FakeTransport>(Lines(401, body));
        try {
            MakeCaller(transport).CallSync(MakeRequest());
            FAIL() << "expected ProtocolError";
        } catch (const ProtocolError& e) {
            EXPECT_STREQ(e.what(), "Unauthorized");
            EXPECT_EQ(e.status(), 401);
        }
        EXPECT_EQ(transport->stats().chunks_delivered.load(), 0);
    }
}

TEST_F(EndpointCallerTest, BadRequestConcatenatesErrors) {
    auto transport = std::make_shared<FakeTransport>(Lines(400, {R"({"error":"bad "})", R"({"error":"options"})"}));
    try {
        MakeCaller(transport).CallSync(MakeRequest());
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_STREQ(e.what(), "bad options");
    }
}

TEST_F(EndpointCallerTest, OtherStatusCarriesRawBody) {
    auto transport = std::make_shared<FakeTransport>(Lines(500, {"internal error"}));
    try {
        MakeCaller(transport).CallSync(MakeRequest());
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_STREQ(e.what(), "internal error");
        EXPECT_EQ(e.status(), 500);
    }
}

TEST_F(EndpointCallerTest, SameRequestTwiceGivesSameResult) {
    auto transport = std::make_shared<FakeTransport>(Lines(200, {
        R"({"response":"42","done":false})",
        R"({"response":"","done":true})",
    }));
    auto caller = MakeCaller(transport);
    auto first = caller.CallSync(MakeRequest());
    auto second = caller.CallSync(MakeRequest());
    EXPECT_EQ(first.response, second.response);
    EXPECT_EQ(first.http_status_code, second.http_status_code);
    EXPECT_EQ(transport->stats().opens.load(), 2);
}

TEST_F(EndpointCallerTest, ConnectionReleasedOncePerCall) {
    auto transport = std::make_shared<FakeTransport>();
    transport->Enqueue(Lines(200, {R"({"response":"ok","done":true})"}));
    transport->Enqueue(Lines(404, {R"({"error":"model not found"})"}));
    ScriptedResponse refused;
    refused.connect_error = "connection refused";
    transport->Enqueue(refused);
    ScriptedResponse timeout = Lines(200, {R"({"response":"a","done":false})"});
    timeout.read_error = "read timeout";
    transport->Enqueue(timeout);
    transport->Enqueue(Lines(200, {"garbage"}));
    auto caller = MakeCaller(transport);

    EXPECT_NO_THROW(caller.CallSync(MakeRequest()));
    EXPECT_EQ(transport->stats().releases.load(), 1);
    EXPECT_THROW(caller.CallSync(MakeRequest()), ProtocolError);
    EXPECT_EQ(transport->stats().releases.load(), 2);
    EXPECT_THROW(caller.CallSync(MakeRequest()), TransportError);
    EXPECT_EQ(transport->stats().releases.load(), 3);
    EXPECT_THROW(caller.CallSync(MakeRequest()), TransportError);
    EXPECT_EQ(transport->stats().releases.load(), 4);
    EXPECT_THROW(caller.CallSync(MakeRequest()), DecodeError);
    EXPECT_EQ(transport->stats().releases.load(), 5);
    EXPECT_EQ(transport->stats().opens.load(), 5);
}

TEST_F(EndpointCallerTest, BasicAuthHeaderWhenConfigured) {
    auto transport = std::make_shared<FakeTransport>(Lines(200, {R"({"response":"ok","done":true})"}));
    MakeCaller(transport, BasicAuth{"user", "pass"}).CallSync(MakeRequest());

    auto req = transport->stats().LastRequest();
    std::string auth;
    std::string content_type;
    for (const auto& kv : req.headers) {
        if (kv.first == "Authorization") auth = kv.second;
        if (kv.first == "Content-Type") content_type = kv.second;
    }
    EXPECT_EQ(auth, "Basic dXNlcjpwYXNz");
    EXPECT_EQ(content_type, "application/json");
}

TEST_F(EndpointCallerTest, NoAuthorizationHeaderWithoutCredentials) {
    auto transport = std::make_shared<FakeTransport>(Lines(200, {R"({"response":"ok","done":true})"}));
    MakeCaller(transport).CallSync(MakeRequest());

    auto req = transport->stats().LastRequest();
    for (const auto& kv : req.headers) {
        EXPECT_NE(kv.first, "Authorization");
    }
}

TEST_F(EndpointCallerTest, WritesSerializedPayload) {
    auto transport = std::make_shared<FakeTransport>(Lines(200, {R"({"response":"ok","done":true})"}));
    MakeCaller(transport).CallSync(MakeRequest());

    auto req = transport->stats().LastRequest();
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/api/generate");
    auto body = nlohmann::json::parse(req.body);
    EXPECT_EQ(body["model"], "llama2");
    EXPECT_EQ(body["prompt"], "why is the sky blue?");
    EXPECT_EQ(body["stream"], true);
}

TEST_F(EndpointCallerTest, StreamingSinkSeesFragmentsInOrder) {
    auto transport = std::make_shared<FakeTransport>(Lines(200, {
        R"({"response":"a","done":false})",
        R"({"response":"b","done":false})",
        R"({"response":"","done":true})",
    }));
    std::vector<std::string> texts;
    std::vector<bool> finals;
    auto result = MakeCaller(transport).CallStreaming(MakeRequest(), [&](const Fragment& f) {
        texts.push_back(f.text);
        finals.push_back(f.is_final);
    });
    EXPECT_EQ(result.response, "ab");
    EXPECT_EQ(texts, (std::vector<std::string>{"a", "b", ""}));
    EXPECT_EQ(finals, (std::vector<bool>{false, false, true}));
}

TEST_F(EndpointCallerTest, StreamingSinkSkipsErrorFragments) {
    auto transport = std::make_shared<FakeTransport>(Lines(404, {R"({"error":"model not found"})"}));
    int calls = 0;
    EXPECT_THROW(MakeCaller(transport).CallStreaming(MakeRequest(), [&](const Fragment&) { calls++; }), ProtocolError);
    EXPECT_EQ(calls, 0);
}

TEST_F(EndpointCallerTest, StreamWithoutDoneMarkerEndsAtEof) {
    auto transport = std::make_shared<FakeTransport>(Lines(200, {
        R"({"response":"partial","done":false})",
    }));
    auto result = MakeCaller(transport).CallSync(MakeRequest());
    EXPECT_EQ(result.response, "partial");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
