#include "verify/SubmissionVerifier.hpp"
#include "submission/SubmissionAssembler.hpp"
#include "claim/CanonicalJson.hpp"
#include "crypto/Sha256Stream.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

#include <catch2/catch.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace tessera;
using namespace tessera_test;
using json = nlohmann::json;

namespace
{
   struct Harness
   {
      IdentityKey        key1 = IdentityKey::from_seed_hex(SEED1);
      IdentityKey        key2 = IdentityKey::from_seed_hex(SEED2);
      MinerAuth          auth1{1, key1};
      MinerAuth          auth2{2, key2};
      MinerRegistry      registry;
      NonceLedger        ledger{300};
      uint64_t           now = FIXED_NOW;
      SubmissionVerifier verifier{registry, ledger, FreshnessWindow{}, [this] { return now; }};

      Harness()
      {
         registry.bind(1, PUB1);
         registry.bind(2, PUB2);
      }

      Claim claim_for(const MinerAuth& auth, const std::string& artifact, uint64_t nonce,
                      uint64_t ts)
      {
         Claim c;
         c.task_id         = "t1";
         c.miner_id        = auth.miner_id();
         c.performance     = 0.92;
         c.artifact_hash   = Sha256Stream::hash_bytes(artifact);
         c.hyperparameters = json::parse(R"({"lr":0.001})");
         c.timestamp       = ts;
         c.nonce           = nonce;
         return c;
      }

      WireSubmission wire_for(const MinerAuth& auth, const std::string& artifact,
                              uint64_t nonce, uint64_t ts)
      {
         SubmissionAssembler asm_(auth);
         return asm_.assemble(claim_for(auth, artifact, nonce, ts), artifact, "artifact.tar",
                              "application/x-tar");
      }

      WireSubmission wire(uint64_t nonce = 7) { return wire_for(auth1, "hello", nonce, now); }
   };
}  // namespace

TEST_CASE("verifier accepts a genuine submission")
{
   Harness        h;
   WireSubmission w = h.wire();
   CHECK(w.artifact->bytes == "hello");
   CHECK(Claim::parse(*w.payload).artifact_hash == HELLO_SHA256);

   Verdict v = h.verifier.verify(w);
   CHECK(v.accepted());
   CHECK(v.message == "submission accepted for task t1");
   CHECK(h.ledger.contains(1, 7));
}

TEST_CASE("verifier rejects a replayed nonce")
{
   Harness        h;
   WireSubmission w = h.wire();
   CHECK(h.verifier.verify(w).accepted());
   CHECK(h.verifier.verify(w).code == VerdictCode::REPLAYED_NONCE);

   // Same nonce on a different, properly signed claim is still a replay.
   WireSubmission other = h.wire_for(h.auth1, "other artifact", 7, h.now);
   CHECK(h.verifier.verify(other).code == VerdictCode::REPLAYED_NONCE);

   // Nonces are per miner.
   CHECK(h.verifier.verify(h.wire_for(h.auth2, "hello", 7, h.now)).accepted());
}

TEST_CASE("verifier rejects a signature from the wrong key")
{
   Harness h;
   h.registry.bind(1, PUB2);
   CHECK(h.verifier.verify(h.wire()).code == VerdictCode::BAD_SIGNATURE);
}

TEST_CASE("verifier rejects any altered claim field")
{
   Harness        h;
   WireSubmission w       = h.wire();
   json           payload = json::parse(*w.payload);

   SECTION("performance")
   {
      payload["performance"] = 0.99;
   }
   SECTION("task")
   {
      payload["task_id"] = "t2";
   }
   SECTION("hyperparameters")
   {
      payload["hyperparameters"]["lr"] = 0.002;
   }
   SECTION("timestamp")
   {
      payload["timestamp"] = h.now - 1;
   }
   SECTION("nonce")
   {
      payload["nonce"] = 8;
   }
   SECTION("claimed miner")
   {
      payload["miner_id"] = 2;
   }
   w.payload = payload.dump();
   CHECK(h.verifier.verify(w).code == VerdictCode::BAD_SIGNATURE);
   CHECK(h.ledger.size() == 0);
}

TEST_CASE("verifier rejects a flipped signature bit")
{
   Harness        h;
   WireSubmission w = h.wire();
   std::string&   s = *w.signature;
   s[0]             = (s[0] == '0') ? '1' : '0';
   CHECK(h.verifier.verify(w).code == VerdictCode::BAD_SIGNATURE);
}

TEST_CASE("verifier binds the claim to the artifact bytes")
{
   Harness        h;
   WireSubmission w = h.wire();
   w.artifact->bytes = "hellO";
   CHECK(h.verifier.verify(w).code == VerdictCode::BAD_HASH);

   w.artifact->bytes = "hello";
   CHECK(h.verifier.verify(w).accepted());
}

TEST_CASE("verifier tolerates payload re-serialization")
{
   Harness        h;
   WireSubmission w = h.wire();
   w.payload        = json::parse(*w.payload).dump(2);
   CHECK(h.verifier.verify(w).accepted());
}

TEST_CASE("verifier freshness window")
{
   Harness h;
   CHECK(h.verifier.verify(h.wire_for(h.auth1, "a", 1, h.now - 300)).accepted());
   CHECK(h.verifier.verify(h.wire_for(h.auth1, "a", 2, h.now - 301)).code ==
         VerdictCode::STALE_TIMESTAMP);
   CHECK(h.verifier.verify(h.wire_for(h.auth1, "a", 3, h.now + 60)).accepted());
   CHECK(h.verifier.verify(h.wire_for(h.auth1, "a", 4, h.now + 61)).code ==
         VerdictCode::STALE_TIMESTAMP);

   CHECK(h.verifier.is_fresh(h.now, h.now));
   CHECK_FALSE(h.verifier.is_fresh(0, h.now));

   SECTION("stale claims never reach the ledger")
   {
      CHECK_FALSE(h.ledger.contains(1, 2));
      CHECK_FALSE(h.ledger.contains(1, 4));
   }
}

TEST_CASE("verifier rejects an unknown miner")
{
   Harness       h;
   IdentityKey   stranger = IdentityKey::generate();
   MinerAuth     auth(99, stranger);
   CHECK(h.verifier.verify(h.wire_for(auth, "hello", 1, h.now)).code ==
         VerdictCode::UNKNOWN_MINER);
}

TEST_CASE("verifier rejects incomplete submissions")
{
   Harness        h;
   WireSubmission w = h.wire();

   SECTION("no payload")
   {
      w.payload.reset();
   }
   SECTION("no signature")
   {
      w.signature.reset();
   }
   SECTION("no artifact")
   {
      w.artifact.reset();
   }
   CHECK(h.verifier.verify(w).code == VerdictCode::INCOMPLETE_SUBMISSION);
}

TEST_CASE("verifier rejects malformed payloads")
{
   Harness        h;
   WireSubmission w = h.wire();

   SECTION("payload is not JSON")
   {
      w.payload = "{\"task_id\": ";
   }
   SECTION("payload misses a field")
   {
      json p = json::parse(*w.payload);
      p.erase("nonce");
      w.payload = p.dump();
   }
   SECTION("signature wrong length")
   {
      w.signature = w.signature->substr(0, 126);
   }
   SECTION("signature not hex")
   {
      (*w.signature)[3] = 'q';
   }
   SECTION("unknown canonical format")
   {
      w.canon_version = "tessera-canon/2";
   }
   SECTION("number out of range")
   {
      std::string p   = *w.payload;
      size_t      pos = p.find("\"performance\":0.92");
      REQUIRE(pos != std::string::npos);
      p.replace(pos, std::string("\"performance\":0.92").size(), "\"performance\":1e400");
      w.payload = p;
   }
   SECTION("hyperparameter out of range")
   {
      std::string p   = *w.payload;
      size_t      pos = p.find("\"lr\":0.001");
      REQUIRE(pos != std::string::npos);
      p.replace(pos, std::string("\"lr\":0.001").size(), "\"lr\":1e999");
      w.payload = p;
   }
   Verdict v;
   REQUIRE_NOTHROW(v = h.verifier.verify(w));
   CHECK(v.code == VerdictCode::MALFORMED_PAYLOAD);
   CHECK(h.ledger.size() == 0);
}

TEST_CASE("forged submissions do not consume nonces")
{
   Harness        h;
   WireSubmission forged = h.wire_for(h.auth2, "hello", 11, h.now);
   json           p      = json::parse(*forged.payload);
   p["miner_id"]         = 1;
   forged.payload        = p.dump();
   CHECK(h.verifier.verify(forged).code == VerdictCode::BAD_SIGNATURE);

   CHECK(h.verifier.verify(h.wire(11)).accepted());
}

TEST_CASE("verifier decodes raw multipart bodies")
{
   Harness     h;
   EncodedBody enc = encode_multipart(h.wire());

   SECTION("complete body")
   {
      CHECK(h.verifier.verify_body(enc.body, enc.content_type).accepted());
   }
   SECTION("truncated body")
   {
      Verdict v = h.verifier.verify_body(enc.body.substr(0, enc.body.size() - 10),
                                         enc.content_type);
      CHECK(v.code == VerdictCode::MALFORMED_PAYLOAD);
   }
}

TEST_CASE("concurrent verification of one submission accepts once")
{
   Harness                  h;
   WireSubmission           w = h.wire();
   std::atomic<int>         accepted{0};
   std::atomic<int>         replayed{0};
   std::vector<std::thread> threads;
   for (int t = 0; t < 8; ++t)
   {
      threads.emplace_back([&] {
         Verdict v = h.verifier.verify(w);
         if (v.accepted())
            ++accepted;
         else if (v.code == VerdictCode::REPLAYED_NONCE)
            ++replayed;
      });
   }
   for (auto& th : threads)
      th.join();
   CHECK(accepted.load() == 1);
   CHECK(replayed.load() == 7);
}

TEST_CASE("assembler refuses inconsistent claims")
{
   Harness h;
   SubmissionAssembler asm_(h.auth1);

   Claim c = h.claim_for(h.auth1, "hello", 1, h.now);
   CHECK_THROWS_AS(asm_.assemble(c, "goodbye", "a.tar", "application/x-tar"), MalformedInput);

   Claim theirs = h.claim_for(h.auth2, "hello", 1, h.now);
   CHECK_THROWS_AS(asm_.assemble(theirs, "hello", "a.tar", "application/x-tar"), MalformedInput);

   Claim fresh = asm_.make_claim("t1", 0.9, json::object(), HELLO_SHA256);
   CHECK(fresh.miner_id == 1);
   CHECK(fresh.timestamp > 0);
   WireSubmission w = asm_.assemble(fresh, "hello", "a.tar", "application/x-tar");
   CHECK(*w.canon_version == CANON_VERSION);
   CHECK(w.signature->size() == 128);
}

TEST_CASE("signature check recomputes canonical bytes")
{
   Harness   h;
   Claim     c   = h.claim_for(h.auth1, "hello", 5, h.now);
   std::string sig = h.auth1.sign(c.canonical_bytes());
   VerifyKey pub = VerifyKey::from_hex(PUB1);
   CHECK(SubmissionVerifier::signature_valid(c, sig, pub));
   CHECK_FALSE(SubmissionVerifier::signature_valid(c, sig, VerifyKey::from_hex(PUB2)));
   CHECK_FALSE(SubmissionVerifier::signature_valid(c, "zz", pub));
}
