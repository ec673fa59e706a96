//
// Created by cory on 4/20/25.
//

#ifndef KELP_CLIENTBOUND_PACKET_IDS_HPP
#define KELP_CLIENTBOUND_PACKET_IDS_HPP

// PLAY
#define PLAY_CHUNK_DATA (0x20)

#endif //KELP_CLIENTBOUND_PACKET_IDS_HPP
