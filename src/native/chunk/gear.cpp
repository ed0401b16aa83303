/* Copyright (C) 2016 NooBaa */
#include "gear.h"

namespace dataid
{

// the first 256 outputs of a default seeded std::mt19937_64.
// weights are part of the identifier format, do not regenerate.

/* clang-format off */
const uint64_t GEAR_TABLE[256] = {
    0xC96D191CF6F6AEA6, 0x401F7AC78BC80F1C, 0xB5EE8CB6ABE457F8, 0xF258D22D4DB91392,
    0x04EEF2B4B5D860CC, 0x67A7AABE10D172D6, 0x40565D50E72B4021, 0x05D07B7D1E8DE386,
    0x8548DEA130821ACC, 0x583C502C832E0A3A, 0x4631AEDE2E67FFD1, 0x8F9FCCBA4388A61F,
    0x23D9A035F5E09570, 0x8B3A26B7AA4BCECB, 0x859C449A06E0302C, 0xDB696AB700FEB090,
    0x7FF1366399D92B12, 0x6B5BD57A3C9113EF, 0xBE892B0C53E40D3D, 0x3FC97B87BED94159,
    0x3D413B8D11B4CCE2, 0x51EFC5D2498D7506, 0xE916957641C27421, 0x2A327E8F39FC19A6,
    0x3EDB3BFE2F0B6337, 0x32C51436B7C00275, 0xB744BED2696ED37E, 0xF7C35C861856282A,
    0xC4F978FB19FFB724, 0x14A93CA1D9BCEA61, 0x75BDA2D6BFFCFCA4, 0x41DBE94941A43D12,
    0xC6EC7495AC0E00FD, 0x957955653083196E, 0xF346DE027CA95D44, 0x702751D1BB724213,
    0x528184B1277F75FE, 0x884BB2027E9AC7B0, 0x41A0BC6DD5C28762, 0x0BA88011CD101288,
    0x814621BD927E0DAC, 0xB23CB1552B043B6E, 0x175A1FED9BBDA880, 0xE838FF59B1C9D964,
    0x07EA06B48FCA72AC, 0x26EBDCF08553011A, 0xFB44EA3C3A45CF1C, 0x9ED34D63DF99A685,
    0x4C7BF671EAEA7207, 0x5C7FC5FC683A1085, 0x7B20C584708499B9, 0x4C3FB0CEB4ADB6B9,
    0x4902095A15D7F3D2, 0xEC97F42C55BC9F40, 0xA0FFC0F9681BB9AC, 0xC149BD468AC1AC86,
    0xB6C1A68207BA2FC9, 0xB906A73E05A92C74, 0x11E0D6EBD61D941D, 0x7CA12FB5B05B5C4D,
    0x16BF95DEFA2CD170, 0xC27697252E02CB81, 0x6C7F49BF802C66F5, 0x98D3DAAA3B2E8562,
    0x161F5FC4BA37F6D7, 0x45E0C63E93FC6383, 0x9FB1DBFBC95C83A0, 0x38DDD8A535D2CBBD,
    0x39B6F08DAF36CA87, 0x6F23D32E2A0FD7FA, 0xFCC027348974B455, 0x360369EDA9C0E07D,
    0xDA6C4763C2C466D7, 0x48BBB7A741E6DDD9, 0xD61C0C76DEB4818C, 0x5DE152345F136375,
    0xEF65D2FCBB279CFD, 0xDC22B9F9F9D7538D, 0x7DAC563216D61E70, 0x05A6F16B79BBD6E9,
    0x5CB3B670AE90BE6C, 0xBC87A781B47462CE, 0x84F579568A8972C8, 0x6C469AD3CBA9B91A,
    0x076EB3891FD21CAB, 0xE8C41087C07C91FC, 0x1CB7CD1DFBDAB648, 0xFAEC2F3C1E29110D,
    0xB0158AACD4DCA9F9, 0x7CC1B5019EA1196D, 0xBC647D48E5E2AEB0, 0x96B30966F70500D8,
    0x87489EE810F7DAA5, 0x74A51EBA09DD373D, 0xD40BB2B0A7CA242D, 0xDED20384BA4B0368,
    0x7DD248AB68B9DF14, 0xF83326963D78833D, 0xE38821FAF65BB505, 0x23654FF720304706,
    0x6FC1C8B51EEC90B2, 0x580A8A7E936A997F, 0x1E7207FE6315D685, 0x8C59C6AFCBFAB7BF,
    0xC24F82B980D1FA2E, 0x084B779CCC9FBE44, 0x1A02F04511F6064E, 0x9640EC87EA1BEE8A,
    0xB1EE0052DD55D069, 0xCAB4F30BB95C5561, 0xD998BABCAF69019F, 0xE0126BEA2556CCD2,
    0x9B016F17C8800310, 0xF41CC5D147950F43, 0xFDA9511773320334, 0xDDF85A4C56345E4D,
    0xA4E47A8EFAE8DEAB, 0x9ACAA313E6DED943, 0xE9A600BE8F5C822B, 0x778D332A7E54AB53,
    0x1442A265CEFE20CA, 0xE78262E6B329807C, 0xD3CCFA96FED4AD17, 0x25B6315BB4E3D4F1,
    0xCEA2B7E820395A1F, 0xAB3B169E3F7BA6BA, 0x237E6923D4000B08, 0xAC1E02DF1E10EF6F,
    0xD519DC015EBF61B2, 0xF4F51187FE96B080, 0xA137326E14771E17, 0x5B10D4A4C1FC81EA,
    0x52BED44BC6EC0A60, 0x10359CFFB84288CE, 0x47D17B92CD7647A9, 0x41C9BAFDB9158765,
    0x16676AA636F40C88, 0x12D8AEFDFF93AD5C, 0x19C55CBAB761FC6E, 0x2174EE4468BDD89F,
    0xA0BD26F5EDDAAC55, 0x4FDDA840F2BEA00D, 0xF387CBA277EE3737, 0xF90BBA5C10DAC7B4,
    0x33A43AFBDA5AEEBE, 0xB9E3019D9AF169BB, 0xAD210AC8D15BBD2B, 0x9132A5599C996D32,
    0xB7E64EB925C34B07, 0x35CB859F0469F3C8, 0xBF1F44D40CBDFDAE, 0xBFBABEAA1611B567,
    0xE4EA67D4C915E61A, 0x1DEBFA223CA7EFE1, 0xA77DFC79C3A3071A, 0x06CC239429A34614,
    0x4927012902F7E84C, 0x9CA15A0AFF31237F, 0x5D9E9BC902C99CA8, 0x47FA9818255561FF,
    0xB613301CA773D9F1, 0xDE64D791FB9AC4FA, 0x1F5AC2193E8E6749, 0xE312B85C388ACFFB,
    0x986B17A971A64FF9, 0xCB8B41A1609C47BB, 0x9132359C66F27446, 0xFD13D5B1693465E5,
    0xF676C5B9C8C31DEC, 0x819C9D4648BDE72E, 0xCB1B9807F2E17075, 0xB833DA21219453AE,
    0x66F5C5F44FB6895F, 0x1DB2622EBC8A5156, 0xD4D55C5A8D8E65C8, 0x57518131D59044B5,
    0xCFDA297096D43D12, 0x3C92C59D9F4F4FC7, 0xEF253867322ED69D, 0x75466261F580F644,
    0xDA5501F76531DFAF, 0xBFF23DAFF1ECF103, 0x5EA264D24CAFA620, 0xA4F6E95085E2C1D3,
    0x96FD21923D8280B4, 0xD7E000660C4E449D, 0x0175F4EA08C6D68F, 0x2FC41E957FB4D4C4,
    0x4C103D0C50171BC7, 0x56B4530E5704AE62, 0xB9D88E9704345821, 0xFE9BBA04DFF384A1,
    0xE6E0124E32EDA8E3, 0xC45BFBF985540DB8, 0x20F9DBCC42DED8C7, 0x47814256F39A4658,
    0x20DCFE42BCB14929, 0xE38ADFBDC8AABA12, 0xCE488F3A3480BA0D, 0x669AA0A29E8FBA7C,
    0x87014F5F7986E0F5, 0x4C13AB920ADF86F3, 0xEAEC363831EF859D, 0xD012AD6AD0766D3E,
    0x849098D9F6E9E379, 0x99A456E8A46CF927, 0xD5756ECF52FA0945, 0x7A595501987485DA,
    0x54440BC1354AE014, 0x979DAD1D15E065DD, 0xD37E09F9234FD36F, 0x778F38E1B1FF715C,
    0x443D82E64256A243, 0xCEB84E9FD0A49A60, 0x20BF8789B57F6A91, 0x5E2332EFBDFA86EB,
    0x05017BB4EB9C21B1, 0x1FBFA8B6C8CD6444, 0x2969D7638335EB59, 0x6F51C81FE6160790,
    0xB111FE1560733B30, 0x16010E086DB16FEB, 0xFCB527B00AAA9DE5, 0x9E7078912213F6EF,
    0x5F0564BEA972C16E, 0x3C96A8EA4778734A, 0x28B01E6AE9968FB3, 0x0970867931D700AE,
    0x1974EDE07597749A, 0xAF16F2F8D8527448, 0xF3BE7DB0FE807F1D, 0xC97FAE4BA2516408,
    0x3C5C9FE803F69AF3, 0x5D2FBE764A80FA7F, 0x5CED7949A12AB4A1, 0xEF23EA8441CF5C53,
    0xFFB5A3079C5F3418, 0x3373D7F543F1AB0D, 0x8D84012AFC9AA746, 0xB287A6F25E5ACDF8,
    0xB12E62AD92C5C858, 0x160BA915DAD28CFD, 0x5BBC7CABA21D33D8, 0x494D103734A77824,
    0x18255BB6DF0816AE, 0xF19033851EBE5FE6, 0x78E17B204F7AEBEB, 0x850F284430FE678C,
    0x26EE6D3CB34A81B6, 0x632EE4D4BC19B0DF, 0x1953EC9AB2137FDB, 0x2A50696FB641F177,
    0x957CEA110B597FA5, 0x793421CCE815A391, 0xA63FC9D153A0E937, 0x8B60C6BEAC47689D,
};
/* clang-format on */

} // namespace dataid
