/**
 * This file is part of libfastcdc.
 */

#include "ingestion/gear_table.h"

namespace fastcdc {

const uint64_t kGearTable[kGearTableSize] = {
  0x3b5d3c7d207e37dcLLU, 0x784d68ba91123086LLU, 0xcd52880f882e7298LLU,
  0xeacf8e4e19fdcca7LLU, 0xc31f385dfbd1632bLLU, 0x1d5f27001e25abe6LLU,
  0x83130bde3c9ad991LLU, 0xc4b225676e9b7649LLU, 0xaa329b29e08eb499LLU,
  0xb67fcbd21e577d58LLU, 0x0027baaada2acf6bLLU, 0xe3ef2d5ac73c2226LLU,
  0x0890f24d6ed312b7LLU, 0xa809e036851d7c7eLLU, 0xf0a6fe5e0013d81bLLU,
  0x1d026304452cec14LLU, 0x03864632648e248fLLU, 0xcdaacf3dcd92b9b4LLU,
  0xf5e012e63c187856LLU, 0x8862f9d3821c00b6LLU, 0xa82f7338750f6f8aLLU,
  0x1e583dc6c1cb0b6fLLU, 0x7a3145b69743a7f1LLU, 0xabb20fee404807ebLLU,
  0xb14b3cfe07b83a5dLLU, 0xb9dc27898adb9a0fLLU, 0x3703f5e91baa62beLLU,
  0xcf0bb866815f7d98LLU, 0x3d9867c41ea9dcd3LLU, 0x1be1fa65442bf22cLLU,
  0x14300da4c55631d9LLU, 0xe698e9cbc6545c99LLU, 0x4763107ec64e92a5LLU,
  0xc65821fc65696a24LLU, 0x76196c064822f0b7LLU, 0x485be841f3525e01LLU,
  0xf652bc9c85974ff5LLU, 0xcad8352face9e3e9LLU, 0x2a6ed1dceb35e98eLLU,
  0xc6f483badc11680fLLU, 0x3cfd8c17e9cf12f1LLU, 0x89b83c5e2ea56471LLU,
  0xae665cfd24e392a9LLU, 0xec33c4e504cb8915LLU, 0x3fb9b15fc9fe7451LLU,
  0xd7fd1fd1945f2195LLU, 0x31ade0853443efd8LLU, 0x255efc9863e1e2d2LLU,
  0x10eab6008d5642cfLLU, 0x46f04863257ac804LLU, 0xa52dc42a789a27d3LLU,
  0xdaaadf9ce77af565LLU, 0x6b479cd53d87febbLLU, 0x6309e2d3f93db72fLLU,
  0xc5738ffbaa1ff9d6LLU, 0x6bd57f3f25af7968LLU, 0x67605486d90d0a4aLLU,
  0xe14d0b9663bfbdaeLLU, 0xb7bbd8d816eb0414LLU, 0xdef8a4f16b35a116LLU,
  0xe7932d85aaaffed6LLU, 0x08161cbae90cfd48LLU, 0x855507beb294f08bLLU,
  0x91234ea6ffd399b2LLU, 0xad70cf4b2435f302LLU, 0xd289a97565bc2d27LLU,
  0x8e558437ffca99deLLU, 0x96d2704b7115c040LLU, 0x0889bbcdfc660e41LLU,
  0x5e0d4e67dc92128dLLU, 0x72a9f8917063ed97LLU, 0x438b69d409e016e3LLU,
  0xdf4fed8a5d8a4397LLU, 0x00f41dcf41d403f7LLU, 0x4814eb038e52603fLLU,
  0x9dafbacc58e2d651LLU, 0xfe2f458e4be170afLLU, 0x4457ec414df6a940LLU,
  0x06e62f1451123314LLU, 0xbd1014d173ba92ccLLU, 0xdef318e25ed57760LLU,
  0x9fea0de9dfca8525LLU, 0x459de1e76c20624bLLU, 0xaeec189617e2d666LLU,
  0x126a2c06ab5a83cbLLU, 0xb1321532360f6132LLU, 0x65421503dbb40123LLU,
  0x2d67c287ea089ab3LLU, 0x6c93bff5a56bd6b6LLU, 0x4ffb2036cab6d98dLLU,
  0xce7b785b1be7ad4fLLU, 0xedb42ef6189fd163LLU, 0xdc905288703988f6LLU,
  0x365f9c1d2c691884LLU, 0xc640583680d99bfeLLU, 0x3cd4624c07593ec6LLU,
  0x7f1ea8d85d7c5805LLU, 0x014842d480b57149LLU, 0x0b649bcb5a828688LLU,
  0xbcd5708ed79b18f0LLU, 0xe987c862fbd2f2f0LLU, 0x982731671f0cd82cLLU,
  0xbaf13e8b16d8c063LLU, 0x8ea3109cbd951bbaLLU, 0xd141045bfb385cadLLU,
  0x2acbc1a0af1f7d30LLU, 0xe6444d89df03bfdfLLU, 0xa18cc771b8188ff9LLU,
  0x9834429db01c39bbLLU, 0x214add07fe086a1fLLU, 0x8f07c19b1f6b3ff9LLU,
  0x56a297b1bf4ffe55LLU, 0x94d558e493c54fc7LLU, 0x40bfc24c764552cbLLU,
  0x931a706f8a8520cbLLU, 0x32229d322935bd52LLU, 0x2560d0f5dc4fefafLLU,
  0x9dbcc48355969bb6LLU, 0x0fd81c3985c0b56aLLU, 0xe03817e1560f2bdaLLU,
  0xc1bb4f81d892b2d5LLU, 0xb0c4864f4e28d2d7LLU, 0x3ecc49f9d9d6c263LLU,
  0x51307e99b52ba65eLLU, 0x8af2b688da84a752LLU, 0xf5d72523b91b20b6LLU,
  0x6d95ff1ff4634806LLU, 0x562f21555458339aLLU, 0xc0ce47f889336346LLU,
  0x487823e5089b40d8LLU, 0xe4727c7ebc6d9592LLU, 0x5a8f7277e94970baLLU,
  0xfca2f406b1c8bb50LLU, 0x5b1f8a95f1791070LLU, 0xd304af9fc9028605LLU,
  0x5440ab7fc930e748LLU, 0x312d25fbca2ab5a1LLU, 0x10f4a4b234a4d575LLU,
  0x90301d55047e7473LLU, 0x3b6372886c61591eLLU, 0x293402b77c444e06LLU,
  0x451f34a4d3e97dd7LLU, 0x3158d814d81bc57bLLU, 0x034942425b9bda69LLU,
  0xe2032ff9e532d9bbLLU, 0x62ae066b8b2179e5LLU, 0x9545e10c2f8d71d8LLU,
  0x7ff7483eb2d23fc0LLU, 0x00945fcebdc98d86LLU, 0x8764bbbe99b26ca2LLU,
  0x1b1ec62284c0bfc3LLU, 0x58e0fcc4f0aa362bLLU, 0x5f4abefa878d458dLLU,
  0xfd74ac2f9607c519LLU, 0xa4e3fb37df8cbfa9LLU, 0xbf697e43cac574e5LLU,
  0x86f14a3f68f4cd53LLU, 0x24a23d076f1ce522LLU, 0xe725cd8048868cc8LLU,
  0xbf3c729eb2464362LLU, 0xd8f6cd57b3cc1ed8LLU, 0x6329e52425541577LLU,
  0x62aa688ad5ae1ac0LLU, 0x0a242566269bf845LLU, 0x168b1a4753aca74bLLU,
  0xf789afefff2e7e3cLLU, 0x6c3362093b6fccdbLLU, 0x4ce8f50bd28c09b2LLU,
  0x006a2db95ae8aa93LLU, 0x975b0d623c3d1a8cLLU, 0x18605d3935338c5bLLU,
  0x5bb6f6136cad3c71LLU, 0x0f53a20701f8d8a6LLU, 0xab8c5ad2e7e93c67LLU,
  0x40b5ac5127acaa29LLU, 0x8c7bf63c2075895fLLU, 0x78bd9f7e014a805cLLU,
  0xb2c9e9f4f9c8c032LLU, 0xefd6049827eb91f3LLU, 0x2be459f482c16fbdLLU,
  0xd92ce0c5745aaa8cLLU, 0x0aaa8fb298d965b9LLU, 0x2b37f92c6c803b15LLU,
  0x8c54a5e94e0f0e78LLU, 0x95f9b6e90c0a3032LLU, 0xe7939faa436c7874LLU,
  0xd16bfe8f6a8a40c9LLU, 0x44982b86263fd2faLLU, 0xe285fb39f984e583LLU,
  0x779a8df72d7619d3LLU, 0xf2d79a8de8d5dd1eLLU, 0xd1037354d66684e2LLU,
  0x004c82a4e668a8e5LLU, 0x31d40a7668b044e6LLU, 0xd70578538bd02c11LLU,
  0xdb45431078c5f482LLU, 0x977121bb7f6a51adLLU, 0x73d5ccbd34eff8ddLLU,
  0xe437a07d356e17cdLLU, 0x47b2782043c95627LLU, 0x9fb251413e41d49aLLU,
  0xccd70b60652513d3LLU, 0x1c95b31e8a1b49b2LLU, 0xcae73dfd1bcb4c1bLLU,
  0x34d98331b1f5b70fLLU, 0x784e39f22338d92fLLU, 0x18613d4a064df420LLU,
  0xf1d8dae25f0bcebeLLU, 0x33f77c15ae855efcLLU, 0x3c88b3b912eb109cLLU,
  0x956a2ec96bafeea5LLU, 0x1aa005b5e0ad0e87LLU, 0x5500d70527c4bb8eLLU,
  0xe36c57196421cc44LLU, 0x13c4d286cc36ee39LLU, 0x5654a23d818b2a81LLU,
  0x77b1dc13d161abdcLLU, 0x734f44de5f8d5eb5LLU, 0x60717e174a6c89a2LLU,
  0xd47d9649266a211eLLU, 0x5b13a4322bb69e90LLU, 0xf7669609f8b5fc3cLLU,
  0x21e6ac55bedcdac9LLU, 0x9b56b62b61166deaLLU, 0xf48f66b939797e9cLLU,
  0x35f332f9c0e6ae9aLLU, 0xcc733f6a9a878db0LLU, 0x3da161e41cc108c2LLU,
  0xb7d74ae535914d51LLU, 0x4d493b0b11d36469LLU, 0xce264d1dfba9741aLLU,
  0xa9d1f2dc7436dc06LLU, 0x70738016604c2a27LLU, 0x231d36e96e93f3d5LLU,
  0x7666881197838d19LLU, 0x4a2a83090aaad40cLLU, 0xf1e761591668b35dLLU,
  0x7363236497f730a7LLU, 0x301080e37379dd4dLLU, 0x502dea2971827042LLU,
  0xc2c5eb858f32625fLLU, 0x786afb9edfafbdffLLU, 0xdaee0d868490b2a4LLU,
  0x617366b3268609f6LLU, 0xae0e35a0fe46173eLLU, 0xd1a07de93e824f11LLU,
  0x079b8b115ea4cca8LLU, 0x93a99274558faebbLLU, 0xfb1e6e22e08a03b3LLU,
  0xea635fdba3698dd0LLU, 0xcf53659328503a5cLLU, 0xcde3b31e6fd5d780LLU,
  0x8e3e4221d3614413LLU, 0xef14d0d86bf1a22cLLU, 0xe1d830d3f16c5ddbLLU,
  0xaabd2b2a451504e1LLU,
};

const uint64_t kCutMasks[kMaxMaskBits + 1] = {
  0,                      //  0: padding
  0,                      //  1: padding
  0,                      //  2: padding
  0,                      //  3: padding
  0,                      //  4: padding
  0x0000000001804110LLU,  //  5: only reached with normalization
  0x0000000001803110LLU,  //  6: 64B
  0x0000000018035100LLU,  //  7: 128B
  0x0000001800035300LLU,  //  8: 256B
  0x0000019000353000LLU,  //  9: 512B
  0x0000590003530000LLU,  // 10: 1kB
  0x0000d90003530000LLU,  // 11: 2kB
  0x0000d90103530000LLU,  // 12: 4kB
  0x0000d90303530000LLU,  // 13: 8kB
  0x0000d90313530000LLU,  // 14: 16kB
  0x0000d90f03530000LLU,  // 15: 32kB
  0x0000d90303537000LLU,  // 16: 64kB
  0x0000d90703537000LLU,  // 17: 128kB
  0x0000d90707537000LLU,  // 18: 256kB
  0x0000d91707537000LLU,  // 19: 512kB
  0x0000d91747537000LLU,  // 20: 1MB
  0x0000d91767537000LLU,  // 21: 2MB
  0x0000d93767537000LLU,  // 22: 4MB
  0x0000d93777537000LLU,  // 23: 8MB
  0x0000d93777577000LLU,  // 24: 16MB
  0x0000db3777577000LLU,  // 25: only reached with normalization
};


GearTable::GearTable(const uint64_t seed) : seed_(seed) {
  const uint64_t shifted_seed = seed << 1;
  for (unsigned i = 0; i < kGearTableSize; ++i) {
    base_[i] = kGearTable[i] ^ seed;
    shifted_[i] = (kGearTable[i] << 1) ^ shifted_seed;
  }
}


bool CutMasks::Select(const uint64_t average_size,
                      const unsigned normalization,
                      CutMasks *masks)
{
  const unsigned average_bits = Log2Pow2(average_size);
  if (normalization > average_bits)
    return false;
  const unsigned small_bits = average_bits + normalization;
  const unsigned large_bits = average_bits - normalization;
  if ((small_bits > kMaxMaskBits) || (large_bits < kMinMaskBits))
    return false;

  masks->small = kCutMasks[small_bits];
  masks->large = kCutMasks[large_bits];
  masks->small_shifted = masks->small << 1;
  masks->large_shifted = masks->large << 1;
  return true;
}

}  // namespace fastcdc
