/* Copyright (C) 2016 NooBaa */
#include "minhash.h"

namespace dataid
{

static const uint64_t MERSENNE_PRIME = (uint64_t(1) << 61) - 1;
static const uint64_t MAX_HASH = 0xffffffffull;

// permutation coefficients drawn from std::mt19937_64 seeded with 1,
// alternating a = 1 + x % (p - 1) and b = x % p.
// they are part of the identifier format, do not regenerate.

/* clang-format off */
const uint64_t MINHASH_A[MINHASH_PERMUTATIONS] = {
    0x0245BD5FBB686F6Bull, 0x1382D1E77AE645A1ull, 0x19D47572ECFC673Dull,
    0x18833635915BD1BBull, 0x11E180B364F46109ull, 0x16E6678D39FEEF01ull,
    0x0A26A1A840991E72ull, 0x0B2DDC59760D03E3ull, 0x0AB7A473D29376C6ull,
    0x197EFACA4DBD97EAull, 0x093A09523AFA6FD4ull, 0x1547A68CFDD0414Bull,
    0x125ECDF403233268ull, 0x1E8DEE4C09D96C4Cull, 0x11DBD9F06D472B23ull,
    0x0A4AE8E06A9888B4ull, 0x07A9F8B641C7EB8Aull, 0x10BB3E55B6D6C3F1ull,
    0x036F837B19707521ull, 0x09D7152814D89686ull, 0x02A351C63E427C9Full,
    0x053E8231C1113579ull, 0x01B650B9A9C4FD04ull, 0x1BD408A4CD4CCB78ull,
    0x1F508714E111F48Bull, 0x0BB38659152A8A08ull, 0x0D0059F3013E6F6Dull,
    0x03972FC55120DCC7ull, 0x0EE96FA903BDC42Eull, 0x11208C94A5D755D9ull,
    0x15A6D11EBC0F935Cull, 0x0258A8FD88826B5Full, 0x094880DA753790DEull,
    0x0C82B10148AECAFCull, 0x03D1A72DCD442DEFull, 0x037871C418DF4555ull,
    0x1086F6C93E34B887ull, 0x1EFD4E7E3942253Aull, 0x09342C259FF78D64ull,
    0x18D8D13A5E25D15Cull, 0x102BA83F96BA9565ull, 0x15A578B91204AE74ull,
    0x06514EA0FBDFCECBull, 0x0C5195129F32C357ull, 0x02E9870DFA382A64ull,
    0x1E916ED57DF25FCAull, 0x07D7CF8D57BBCDC7ull, 0x04047F835A666DA2ull,
    0x194D1E5584964A7Bull, 0x04658BBA197E60F7ull, 0x03A06F626E53C8ABull,
    0x03DC2B3CF1BB3E6Full, 0x1DDFD2A121E3F3D4ull, 0x14466FA30FCA5AF9ull,
    0x09A3FC132883BE7Eull, 0x17CAEB171501EF68ull, 0x17490DC13FCEE154ull,
    0x19E0A36AFB6C15DDull, 0x1369B0373C1128ECull, 0x1F35FE60774B1BF7ull,
    0x0A1485BEB4F0C766ull, 0x1978B73327EDF9F4ull, 0x1D789B8C57B41047ull,
    0x0962A42588ED677Full,
};

const uint64_t MINHASH_B[MINHASH_PERMUTATIONS] = {
    0x02EB92502318FA4Full, 0x0561D8057935C08Eull, 0x094EC2D2B9936850ull,
    0x130D84F91BF14B09ull, 0x029E835C0E448015ull, 0x0E61BD8674B6331Full,
    0x18BCFC057E745A64ull, 0x1FF1722C566A519Aull, 0x0DA0E546AAF708C0ull,
    0x051AC15E436FCBEAull, 0x1FBDDC1F91C5BF6Cull, 0x0E6240030EECC15Dull,
    0x1CF8FA026C9F0D1Aull, 0x11B1C7962DB13031ull, 0x05D601951A58A5CFull,
    0x047C72C63386BCB8ull, 0x05FB9C2170DAA717ull, 0x18D462C4EA0C48C0ull,
    0x1EDFFFB0A1180E15ull, 0x08840C169F64A1FEull, 0x0303AC94BA574D32ull,
    0x04FF591B35F3337Dull, 0x1FB93DBFBB453BF1ull, 0x0E2AA42AE3E48E76ull,
    0x097D4ED47B672B53ull, 0x1E8B2F266DEE6A67ull, 0x1A9526CD35C81366ull,
    0x13262A1D394FDD4Aull, 0x0E8555600A77FB17ull, 0x0322E86A8CC21269ull,
    0x0027D7CB6662829Full, 0x1B257E38EACE5141ull, 0x1390F38634C2A9F9ull,
    0x063EB9AE59C0844Full, 0x1FCC2C9E2A77F90Full, 0x1CA536B268F68CC3ull,
    0x1C4D7EC49AD9F356ull, 0x1620661FA48720D6ull, 0x0A8CA5260A7F2FC9ull,
    0x1273BACD647D0F75ull, 0x188386BBE0CEA7AEull, 0x02D2EE362E0D74A6ull,
    0x059B73C1B505DFD3ull, 0x1C797497EBEC89ECull, 0x049D1B30698E8F8Dull,
    0x1A8BD65BC0D88CD8ull, 0x05567CE447243438ull, 0x05F15C7B961B7A76ull,
    0x177B8FE2203AD139ull, 0x0E883CCF86F1DE24ull, 0x012EA3DB85A9F29Cull,
    0x0B0E447B3CB3E74Cull, 0x04B34F04E23C0C60ull, 0x11F7A8F88056C4EEull,
    0x0905A2946CF3168Full, 0x05F9FBB772E99418ull, 0x1820B2F2F5C524DFull,
    0x1B701FFED4FCA5D4ull, 0x1A8302C410A4CF05ull, 0x0A47548113DB661Eull,
    0x0ED7B3EC01C57F07ull, 0x0DCB41A739D15351ull, 0x06DB54E5122610E8ull,
    0x1FC4B0BAFED629AEull,
};
/* clang-format on */

std::vector<uint32_t>
minimum_hash(const std::vector<uint32_t>& features, int n)
{
    if (n < 1 || n > MINHASH_PERMUTATIONS) {
        throw Exception(XSTR() << "minimum_hash: " << DVAL(n) << "should be in range 1-" << MINHASH_PERMUTATIONS);
    }

    std::vector<uint64_t> hashes(n, ~uint64_t(0));
    for (const uint32_t f : features) {
        for (int i = 0; i < n; ++i) {
            // multiply and add wrap around 64 bits before the modulo
            const uint64_t h = ((MINHASH_A[i] * f + MINHASH_B[i]) % MERSENNE_PRIME) & MAX_HASH;
            if (h < hashes[i]) {
                hashes[i] = h;
            }
        }
    }

    std::vector<uint32_t> result(n);
    for (int i = 0; i < n; ++i) {
        result[i] = static_cast<uint32_t>(hashes[i]);
    }
    return result;
}

} // namespace dataid
