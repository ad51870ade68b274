#pragma once

#include <gmock/gmock.h>

#include "verifier_transport.hpp"

class VerifierTransportMock : public VerifierTransportInterface
{
public:
    MOCK_METHOD(mw::E<TransportReply>, postJSON, (const std::string&),
                (const, override));
};
