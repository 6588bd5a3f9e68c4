// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../FtpBridge/Source/afs/concrete.h"
#include "fake_backend.h"

using namespace fbr;


class BackendFactoryTest : public ::testing::Test
{
protected:
    BackendFactory createFactory(const std::vector<RemoteProtocol>& protocols)
    {
        std::map<RemoteProtocol, std::shared_ptr<const ProtocolBackend>> backends;
        for (const RemoteProtocol protocol : protocols)
            backends.emplace(protocol, std::make_shared<FakeBackend>(remote_, protocol));
        return BackendFactory(std::move(backends));
    }

    FakeRemote remote_;
};


TEST_F(BackendFactoryTest, AutoResolvesToConfiguredDefault)
{
    EXPECT_EQ(resolveProtocol(RequestedProtocol::autoSelect, RemoteProtocol::ftps), RemoteProtocol::ftps);
    EXPECT_EQ(resolveProtocol(RequestedProtocol::autoSelect, RemoteProtocol::sftp), RemoteProtocol::sftp);
    EXPECT_EQ(resolveProtocol(RequestedProtocol::ftp,        RemoteProtocol::sftp), RemoteProtocol::ftp);
}


TEST_F(BackendFactoryTest, ExplicitProtocolSelected)
{
    const BackendFactory factory = createFactory({RemoteProtocol::ftp, RemoteProtocol::ftps, RemoteProtocol::sftp});

    EXPECT_EQ(factory.select(RequestedProtocol::ftp,  RemoteProtocol::ftps)->getProtocol(), RemoteProtocol::ftp);
    EXPECT_EQ(factory.select(RequestedProtocol::sftp, RemoteProtocol::ftps)->getProtocol(), RemoteProtocol::sftp);
    EXPECT_EQ(factory.select(RequestedProtocol::autoSelect, RemoteProtocol::ftps)->getProtocol(), RemoteProtocol::ftps);
}


TEST_F(BackendFactoryTest, MissingCapabilityIsUnsupported)
{
    const BackendFactory factory = createFactory({RemoteProtocol::ftp, RemoteProtocol::ftps});

    EXPECT_FALSE(factory.isAvailable(RemoteProtocol::sftp));
    EXPECT_THROW(factory.select(RequestedProtocol::sftp, RemoteProtocol::ftps), UnsupportedProtocolError);
    EXPECT_THROW(factory.select(RequestedProtocol::autoSelect, RemoteProtocol::sftp), UnsupportedProtocolError);
}


TEST_F(BackendFactoryTest, AvailableProtocolsInEnumOrder)
{
    const BackendFactory factory = createFactory({RemoteProtocol::sftp, RemoteProtocol::ftp});

    const std::vector<RemoteProtocol> expected{RemoteProtocol::ftp, RemoteProtocol::sftp};
    EXPECT_EQ(factory.getAvailableProtocols(), expected);
}


TEST_F(BackendFactoryTest, ProtocolNames)
{
    EXPECT_EQ(getProtocolName(RemoteProtocol::ftps), "ftps");
    EXPECT_EQ(parseRemoteProtocol("SFTP"), RemoteProtocol::sftp);
    EXPECT_FALSE(parseRemoteProtocol("auto").has_value());
    EXPECT_EQ(parseRequestedProtocol("auto"), RequestedProtocol::autoSelect);
    EXPECT_FALSE(parseRequestedProtocol("http").has_value());
}
