//Catch includes
#include <catch2/catch_test_macros.hpp>

//Our includes
#include "LfsBatch.h"
#include "LfsErrors.h"
#include "LfsMultipartTransferAdapter.h"
#include "LfsTransferAdapter.h"

//Qt includes
#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>

using namespace QLfs;

namespace {
const QString TestOid = QStringLiteral("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("LfsBatchRequest builds the batch payload", "[LFS]") {
    LfsObjectAttributes attributes;
    attributes.oid = TestOid;
    attributes.size = 3;
    attributes.addExtraAttributes({{QStringLiteral("note"), QStringLiteral("hi")}});

    LfsBatchRequest request;
    request.operation = LfsOperation::Upload;
    request.transfers = {QStringLiteral("multipart-basic"), QStringLiteral("basic")};
    request.objects = {attributes};

    SECTION("Without a ref") {
        const QJsonObject json = QJsonDocument::fromJson(request.toPayload()).object();
        CHECK(json.value(QStringLiteral("operation")).toString().toStdString() == "upload");
        CHECK(json.value(QStringLiteral("transfers")).toArray().size() == 2);
        CHECK(json.value(QStringLiteral("transfers")).toArray().at(0).toString().toStdString() == "multipart-basic");
        CHECK(!json.contains(QStringLiteral("ref")));

        const QJsonArray objects = json.value(QStringLiteral("objects")).toArray();
        REQUIRE(objects.size() == 1);
        CHECK(objects.at(0).toObject().value(QStringLiteral("oid")).toString() == TestOid);
        CHECK(objects.at(0).toObject().value(QStringLiteral("size")).toInt() == 3);
        CHECK(objects.at(0).toObject().value(QStringLiteral("x-note")).toString().toStdString() == "hi");
    }

    SECTION("With a ref") {
        request.operation = LfsOperation::Download;
        request.ref = QStringLiteral("refs/heads/main");
        const QJsonObject json = request.toJson();
        CHECK(json.value(QStringLiteral("operation")).toString().toStdString() == "download");
        CHECK(json.value(QStringLiteral("ref")).toObject().value(QStringLiteral("name")).toString().toStdString() == "refs/heads/main");
    }
}

TEST_CASE("LfsBatchResponse parses server replies", "[LFS]") {
    SECTION("Transfer defaults to basic") {
        const QByteArray payload = QByteArrayLiteral(
            "{\"objects\":[{\"oid\":\"") + TestOid.toUtf8() + QByteArrayLiteral("\",\"size\":3,"
            "\"actions\":{\"download\":{\"href\":\"https://storage.example.com/abc\",\"header\":{\"X-Token\":\"1\"}}}}]}");

        auto result = LfsBatchResponse::fromPayload(payload);
        REQUIRE(!result.hasError());
        CHECK(result.value().transfer.toStdString() == "basic");
        REQUIRE(result.value().objects.size() == 1);

        const LfsObjectResponse object = result.value().objects.first();
        CHECK(object.oid == TestOid);
        CHECK(object.size == 3);
        CHECK(!object.hasError());
        CHECK(object.hasAction(QStringLiteral("download")));
        CHECK(!object.hasAction(QStringLiteral("upload")));

        const LfsAction action = LfsAction::fromJson(object.actions.value(QStringLiteral("download")).toObject(), "GET");
        CHECK(action.isValid());
        CHECK(action.method == QByteArray("GET"));
        CHECK(action.headers.value("X-Token") == QByteArray("1"));
    }

    SECTION("Per object errors") {
        const QByteArray payload = QByteArrayLiteral(
            "{\"transfer\":\"basic\",\"objects\":[{\"oid\":\"") + TestOid.toUtf8() + QByteArrayLiteral("\",\"size\":3,"
            "\"error\":{\"code\":404,\"message\":\"Object does not exist\"}}]}");

        auto result = LfsBatchResponse::fromPayload(payload);
        REQUIRE(!result.hasError());
        REQUIRE(result.value().objects.size() == 1);
        CHECK(result.value().objects.first().hasError());
        CHECK(result.value().objects.first().errorCode == 404);
        CHECK(result.value().objects.first().errorMessage.toStdString() == "Object does not exist");
    }

    SECTION("Garbage is a protocol error") {
        auto result = LfsBatchResponse::fromPayload(QByteArrayLiteral("<html>nope</html>"));
        CHECK(result.hasError());
        CHECK(result.errorCode() == static_cast<int>(LfsErrorCode::Protocol));
    }
}

TEST_CASE("LfsAction only accepts http urls", "[LFS]") {
    QJsonObject object;
    object.insert(QStringLiteral("href"), QStringLiteral("ftp://example.com/file"));
    CHECK(!LfsAction::fromJson(object, "GET").isValid());

    object.insert(QStringLiteral("href"), QStringLiteral("http://example.com/file"));
    object.insert(QStringLiteral("method"), QStringLiteral("patch"));
    const LfsAction action = LfsAction::fromJson(object, "PUT");
    CHECK(action.isValid());
    CHECK(action.method == QByteArray("PATCH"));
}

TEST_CASE("LfsMultipartTransferAdapter reads parts and digests", "[LFS]") {
    const QByteArray payload = QByteArrayLiteral(
        "{\"transfer\":\"multipart-basic\",\"objects\":[{\"oid\":\"") + TestOid.toUtf8() + QByteArrayLiteral("\",\"size\":6,"
        "\"actions\":{\"parts\":["
        "{\"href\":\"http://example.com/p/0\",\"pos\":0,\"size\":4,\"want_digest\":\"contentMD5\"},"
        "{\"href\":\"http://example.com/p/4\",\"pos\":4,\"size\":2,\"method\":\"POST\"}],"
        "\"commit\":{\"href\":\"http://example.com/commit\"}}}]}");

    auto result = LfsBatchResponse::fromPayload(payload);
    REQUIRE(!result.hasError());

    const auto parts = LfsMultipartTransferAdapter::parts(result.value().objects.first(), "PUT");
    REQUIRE(parts.size() == 2);
    CHECK(parts.at(0).pos == 0);
    CHECK(parts.at(0).size == 4);
    CHECK(parts.at(0).action.method == QByteArray("PUT"));
    CHECK(parts.at(0).wantDigest.toStdString() == "contentMD5");
    CHECK(parts.at(1).pos == 4);
    CHECK(parts.at(1).action.method == QByteArray("POST"));

    const QByteArray data("cave");
    const auto md5 = LfsMultipartTransferAdapter::digestHeader(QStringLiteral("contentMD5"), data);
    CHECK(md5.first == QByteArray("Content-MD5"));
    CHECK(md5.second == QCryptographicHash::hash(data, QCryptographicHash::Md5).toBase64());

    const auto sha = LfsMultipartTransferAdapter::digestHeader(QStringLiteral("crc32, sha-256;q=0.5"), data);
    CHECK(sha.first == QByteArray("Digest"));
    CHECK(sha.second == QByteArray("SHA-256=") + QCryptographicHash::hash(data, QCryptographicHash::Sha256).toBase64());

    CHECK(LfsMultipartTransferAdapter::digestHeader(QStringLiteral("crc32"), data).first.isEmpty());
    CHECK(LfsMultipartTransferAdapter::digestHeader(QString(), data).first.isEmpty());
}
